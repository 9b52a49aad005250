#include "health_handler.hpp"

#include <userver/formats/json/serialize.hpp>
#include <userver/http/content_type.hpp>
#include <userver/server/http/http_request.hpp>

#include "model_registry_component/model_registry_component.hpp"
#include "prediction_serializer/prediction_serializer.hpp"

namespace fraud_fusion {

HealthHandler::HealthHandler(const userver::components::ComponentConfig& config,
                             const userver::components::ComponentContext& context)
    : HttpHandlerBase(config, context),
      registry_(context.FindComponent<ModelRegistryComponent>().GetRegistry()) {}

std::string HealthHandler::HandleRequestThrow(const userver::server::http::HttpRequest& request,
                                              userver::server::request::RequestContext&) const {
    request.GetHttpResponse().SetContentType(userver::http::content_type::kApplicationJson);
    return userver::formats::json::ToString(SerializeHealth(registry_.LoadedKeys()));
}

} // namespace fraud_fusion
