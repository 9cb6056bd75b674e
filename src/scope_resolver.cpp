#include "onboarding/scope_resolver.hpp"
#include "onboarding/strings.hpp"

namespace onboarding {

namespace {

const ScopeTemplate* find_template(ResourceType type) {
    for (const auto& t : scope_templates())
        if (t.type == type) return &t;
    return nullptr;
}

} // namespace

// ── Resource-type table ───────────────────────────────────────────────────────

const std::vector<ScopeTemplate>& scope_templates() {
    static const std::vector<ScopeTemplate> table = {
        { ResourceType::ResourceGroup,         "ResourceGroup",         "",                                             ""           },
        { ResourceType::StorageAccount,        "StorageAccount",        "Microsoft.Storage/storageAccounts/",           ""           },
        { ResourceType::VirtualMachine,        "VirtualMachine",        "Microsoft.Compute/virtualMachines/",           ""           },
        { ResourceType::AppService,            "AppService",            "Microsoft.Web/sites/",                         ""           },
        { ResourceType::AzureFunction,         "AzureFunction",         "Microsoft.Web/sites/",                         "/functions" },
        { ResourceType::KeyVault,              "KeyVault",              "Microsoft.KeyVault/vaults/",                   ""           },
        { ResourceType::AzureSQLDatabase,      "AzureSQLDatabase",      "Microsoft.Sql/servers/",                       ""           },
        { ResourceType::CosmosDB,              "CosmosDB",              "Microsoft.DocumentDB/databaseAccounts/",       ""           },
        { ResourceType::AKS,                   "AKS",                   "Microsoft.ContainerService/managedClusters/",  ""           },
        { ResourceType::LogAnalytics,          "LogAnalytics",          "Microsoft.OperationalInsights/workspaces/",    ""           },
        { ResourceType::APIManagement,         "APIManagement",         "Microsoft.ApiManagement/service/",             ""           },
        { ResourceType::ServiceBus,            "ServiceBus",            "Microsoft.ServiceBus/namespaces/",             ""           },
        { ResourceType::AzureSynapseAnalytics, "AzureSynapseAnalytics", "Microsoft.Synapse/workspaces/",                ""           },
        { ResourceType::DataFactory,           "DataFactory",           "Microsoft.DataFactory/factories/",             ""           },
        { ResourceType::AzureBastion,          "AzureBastion",          "Microsoft.Network/bastionHosts/",              ""           },
        { ResourceType::ContainerRegistry,     "ContainerRegistry",     "Microsoft.ContainerRegistry/registries/",      ""           },
        { ResourceType::Network,               "Network",               "Microsoft.Network/virtualNetworks/",           ""           },
    };
    return table;
}

std::vector<ResourceType> supported_resource_types() {
    std::vector<ResourceType> types;
    types.reserve(scope_templates().size());
    for (const auto& t : scope_templates()) types.push_back(t.type);
    return types;
}

std::optional<ResourceType> parse_resource_type(const std::string& tag) {
    for (const auto& t : scope_templates())
        if (iequals(t.name, tag)) return t.type;
    return std::nullopt;
}

std::string to_string(ResourceType type) {
    const auto* t = find_template(type);
    return t ? t->name : "Unknown";
}

// ── Scope construction ────────────────────────────────────────────────────────

std::string scope_for(ResourceType type,
                      const std::string& subscription_id,
                      const std::string& resource_group_name,
                      const std::string& resource_name) {
    std::string scope = "/subscriptions/" + subscription_id + "/resourceGroups/";

    // ResourceGroup rows carry the group in the name column.
    if (type == ResourceType::ResourceGroup) return scope + resource_name;

    const auto* t = find_template(type);
    scope += resource_group_name + "/providers/";
    if (t) scope += t->provider_path + resource_name + t->suffix;
    return scope;
}

std::optional<std::string> resolve_scope(const std::string& resource_type_tag,
                                         const std::string& subscription_id,
                                         const std::string& resource_group_name,
                                         const std::string& resource_name) {
    auto type = parse_resource_type(resource_type_tag);
    if (!type) return std::nullopt;
    return scope_for(*type, subscription_id, resource_group_name, resource_name);
}

} // namespace onboarding
