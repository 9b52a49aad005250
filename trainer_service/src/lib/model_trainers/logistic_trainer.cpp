#include "logistic_trainer.hpp"

#include <cmath>
#include <stdexcept>

#include <Eigen/Dense>

#include <userver/logging/log.hpp>

namespace fraud_fusion::training {

LogisticModel FitLogistic(const LabeledMatrix& data,
                          const LogisticConfig& config,
                          const std::vector<std::string_view>& feature_names) {
    const auto n = static_cast<Eigen::Index>(data.Rows());
    const auto d = static_cast<Eigen::Index>(data.NumFeatures());
    if (feature_names.size() != data.NumFeatures()) {
        throw std::invalid_argument("Feature names do not match the training matrix");
    }
    const std::size_t positives = data.CountLabel(1);
    const std::size_t negatives = data.Rows() - positives;
    if (positives == 0 || negatives == 0) {
        throw std::invalid_argument("Logistic regression needs both classes");
    }

    Eigen::Map<const Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>
        raw(data.Values().data(), n, d);

    // Population std, constant columns keep scale 1.
    Eigen::VectorXd means = raw.cast<double>().colwise().mean().transpose();
    Eigen::VectorXd scales(d);
    for (Eigen::Index j = 0; j < d; ++j) {
        const double var = (raw.col(j).cast<double>().array() - means(j)).square().mean();
        const double sd = std::sqrt(var);
        scales(j) = sd > 0.0 ? sd : 1.0;
    }

    // Design matrix with a trailing intercept column.
    Eigen::MatrixXd x(n, d + 1);
    for (Eigen::Index j = 0; j < d; ++j) {
        x.col(j) = (raw.col(j).cast<double>().array() - means(j)) / scales(j);
    }
    x.col(d).setOnes();

    Eigen::VectorXd y(n);
    Eigen::VectorXd sample_weight(n);
    const double w_pos = static_cast<double>(n) / (2.0 * static_cast<double>(positives));
    const double w_neg = static_cast<double>(n) / (2.0 * static_cast<double>(negatives));
    for (Eigen::Index i = 0; i < n; ++i) {
        y(i) = data.Label(static_cast<std::size_t>(i));
        sample_weight(i) = y(i) > 0.5 ? w_pos : w_neg;
    }

    Eigen::VectorXd penalty = Eigen::VectorXd::Ones(d + 1);
    penalty(d) = 0.0;

    Eigen::VectorXd beta = Eigen::VectorXd::Zero(d + 1);
    int iteration = 0;
    bool converged = false;
    while (!converged && iteration < config.max_iterations) {
        ++iteration;
        Eigen::VectorXd p = (x * beta).unaryExpr([](double z) { return Sigmoid(z); });
        Eigen::VectorXd curvature =
            (sample_weight.array() * p.array() * (1.0 - p.array())).matrix();

        Eigen::VectorXd gradient =
            penalty.cwiseProduct(beta) - config.c * (x.transpose() * sample_weight.cwiseProduct(y - p));
        Eigen::MatrixXd hessian = config.c * (x.transpose() * curvature.asDiagonal() * x);
        hessian.diagonal() += penalty;

        Eigen::VectorXd step = hessian.ldlt().solve(gradient);
        if (!step.allFinite()) {
            throw std::runtime_error("Logistic regression diverged");
        }
        beta -= step;
        converged = step.lpNorm<Eigen::Infinity>() < config.tolerance;
    }
    if (!converged) {
        LOG_WARNING() << "Logistic regression stopped at max_iterations=" << config.max_iterations;
    }

    models::LogisticModel proto;
    for (Eigen::Index j = 0; j < d; ++j) {
        proto.add_feature_names(std::string(feature_names[static_cast<std::size_t>(j)]));
        proto.add_means(means(j));
        proto.add_scales(scales(j));
        proto.add_weights(beta(j));
    }
    proto.set_intercept(beta(d));
    proto.set_iterations(iteration);

    LOG_INFO() << "Logistic regression fit in " << iteration << " iterations";
    return LogisticModel::FromProto(proto);
}

} // namespace fraud_fusion::training
