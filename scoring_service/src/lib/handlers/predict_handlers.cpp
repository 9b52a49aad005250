#include "predict_handlers.hpp"

#include <fmt/format.h>

#include <userver/formats/json/serialize.hpp>
#include <userver/http/content_type.hpp>
#include <userver/logging/log.hpp>
#include <userver/server/handlers/exceptions.hpp>
#include <userver/server/http/http_request.hpp>
#include <userver/server/http/http_status.hpp>

#include "errors/errors.hpp"
#include "model_registry_component/model_registry_component.hpp"
#include "prediction_serializer/prediction_serializer.hpp"
#include "request_parser/request_parser.hpp"

namespace fraud_fusion {

namespace {

// Runs `score` and maps the domain errors to HTTP: a bad body is 400, an
// untrained capability is 503. Model library failures propagate as 500.
template <typename Score>
std::string Respond(const userver::server::http::HttpRequest& request, Score&& score) {
    request.GetHttpResponse().SetContentType(userver::http::content_type::kApplicationJson);
    try {
        return userver::formats::json::ToString(SerializePrediction(score()));
    } catch (const InvalidRequestError& e) {
        throw userver::server::handlers::ClientError(
            userver::server::handlers::ExternalBody{userver::formats::json::ToString(SerializeError(e.what()))});
    } catch (const ArtifactMissingError& e) {
        LOG_WARNING() << "Rejecting " << request.GetUrl() << ": " << e.what();
        request.SetResponseStatus(userver::server::http::HttpStatus::kServiceUnavailable);
        return userver::formats::json::ToString(SerializeError(
            fmt::format("Model '{}' is not loaded. Run the trainer to produce it and restart the service.",
                        e.Key())));
    }
}

} // anonymous namespace

PredictPrimaryHandler::PredictPrimaryHandler(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : HttpHandlerBase(config, context),
      scoring_(context.FindComponent<ModelRegistryComponent>().GetScoringService()) {}

std::string PredictPrimaryHandler::HandleRequestThrow(
    const userver::server::http::HttpRequest& request,
    userver::server::request::RequestContext&) const {
    return Respond(request, [&] {
        return scoring_.ScorePrimary(ParsePaymentRequest(request.RequestBody()));
    });
}

PredictSecondaryHandler::PredictSecondaryHandler(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : HttpHandlerBase(config, context),
      scoring_(context.FindComponent<ModelRegistryComponent>().GetScoringService()) {}

std::string PredictSecondaryHandler::HandleRequestThrow(
    const userver::server::http::HttpRequest& request,
    userver::server::request::RequestContext&) const {
    return Respond(request, [&] {
        return scoring_.ScoreSecondary(ParseCardRequest(request.RequestBody()));
    });
}

} // namespace fraud_fusion
