#pragma once

#include <optional>
#include <string>
#include <vector>

namespace onboarding {

enum class ResourceType {
    ResourceGroup,
    StorageAccount,
    VirtualMachine,
    AppService,
    AzureFunction,
    KeyVault,
    AzureSQLDatabase,
    CosmosDB,
    AKS,
    LogAnalytics,
    APIManagement,
    ServiceBus,
    AzureSynapseAnalytics,
    DataFactory,
    AzureBastion,
    ContainerRegistry,
    Network
};

/**
 * ScopeTemplate
 *
 * One row of the resource-type table. A scope is built as
 *
 *   /subscriptions/S/resourceGroups/G/providers/<provider_path><R><suffix>
 *
 * except for ResourceGroup, which has no provider segment and uses the
 * resource name as the group name.
 */
struct ScopeTemplate {
    ResourceType type;
    std::string  name;           // canonical manifest tag
    std::string  provider_path;  // e.g. "Microsoft.Storage/storageAccounts/"
    std::string  suffix;         // e.g. "/functions", usually empty
};

/// All supported resource types, in table order.
const std::vector<ScopeTemplate>& scope_templates();

std::vector<ResourceType> supported_resource_types();

/// Case-insensitive match against the canonical tags. nullopt for anything else.
std::optional<ResourceType> parse_resource_type(const std::string& tag);

std::string to_string(ResourceType type);

/// Pure string construction; never validates that the parts are non-empty.
std::string scope_for(ResourceType type,
                      const std::string& subscription_id,
                      const std::string& resource_group_name,
                      const std::string& resource_name);

/// nullopt means UnknownResourceType; the caller still holds the offending tag.
std::optional<std::string> resolve_scope(const std::string& resource_type_tag,
                                         const std::string& subscription_id,
                                         const std::string& resource_group_name,
                                         const std::string& resource_name);

} // namespace onboarding
