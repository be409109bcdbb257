#include "core/pipeline_builder.hpp"
#include "core/pipeline.hpp"

#include <format>
#include <stdexcept>
#include <string>

namespace goldminer {

std::shared_ptr<Pipeline> PipelineBuilder::build() {
    std::string missing;
    const auto require = [&missing](bool present, const char* component) {
        if (present) return;
        if (!missing.empty()) missing += ", ";
        missing += component;
    };

    require(c_.promo_classifier != nullptr, "promo_classifier");
    require(c_.bank_identifier != nullptr, "bank_identifier");
    require(c_.field_extractor != nullptr, "field_extractor");
    require(c_.account_resolver != nullptr, "account_resolver");
    require(c_.state_classifier != nullptr, "state_classifier");
    require(c_.categorizer != nullptr, "categorizer");

    if (!missing.empty()) {
        throw std::runtime_error(std::format("PipelineBuilder: missing required component(s): {}", missing));
    }
    return std::make_shared<Pipeline>(std::move(c_));
}

} // namespace goldminer
