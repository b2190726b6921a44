#include "config_admin.hpp"
#include "request_validator.hpp"

ConfigAdmin::ConfigAdmin(Cluster& cluster, const RetryOrchestrator& retry)
    : cluster_(cluster), retry_(retry) {
}

DescribeConfigsResponse ConfigAdmin::describeConfigs(const std::vector<ResourceConfigQuery>& resources,
                                                     bool include_synonyms) {
    RequestValidator::validateDescribeConfigs(resources);

    RetryStrategy strategy;
    strategy.description = "describe configs";
    strategy.retriable = {ErrorType::NOT_CONTROLLER};

    return retry_.execute<DescribeConfigsResponse>(strategy, [&](RetryContext&) {
        cluster_.refreshMetadata();
        auto broker = cluster_.findControllerBroker();
        return broker->describeConfigs(resources, include_synonyms);
    });
}

AlterConfigsResponse ConfigAdmin::alterConfigs(const std::vector<ResourceConfig>& resources,
                                               bool validate_only) {
    RequestValidator::validateAlterConfigs(resources);

    RetryStrategy strategy;
    strategy.description = "alter configs";
    strategy.retriable = {ErrorType::NOT_CONTROLLER};

    return retry_.execute<AlterConfigsResponse>(strategy, [&](RetryContext&) {
        cluster_.refreshMetadata();
        auto broker = cluster_.findControllerBroker();
        return broker->alterConfigs(resources, validate_only);
    });
}
