#ifndef CONFIG_ADMIN_HPP
#define CONFIG_ADMIN_HPP

#include "cluster.hpp"
#include "retry_orchestrator.hpp"
#include <vector>

// Describe and alter resource configs through the controller
class ConfigAdmin {
public:
    ConfigAdmin(Cluster& cluster, const RetryOrchestrator& retry);

    DescribeConfigsResponse describeConfigs(const std::vector<ResourceConfigQuery>& resources,
                                            bool include_synonyms = false);

    AlterConfigsResponse alterConfigs(const std::vector<ResourceConfig>& resources,
                                      bool validate_only = false);

private:
    Cluster& cluster_;
    const RetryOrchestrator& retry_;
};

#endif // CONFIG_ADMIN_HPP
