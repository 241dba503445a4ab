#include <arbor/catalog/resources.hpp>

namespace arbor::catalog {

const char* resource_type_to_string(ResourceType type) {
    switch (type) {
        case ResourceType::Timber: return "timber";
        case ResourceType::Sap:    return "sap";
        case ResourceType::Fruit:  return "fruit";
        case ResourceType::Acorns: return "acorns";
    }
    return "timber";
}

std::optional<ResourceType> resource_type_from_string(std::string_view name) {
    if (name == "timber") return ResourceType::Timber;
    if (name == "sap")    return ResourceType::Sap;
    if (name == "fruit")  return ResourceType::Fruit;
    if (name == "acorns") return ResourceType::Acorns;
    return std::nullopt;
}

} // namespace arbor::catalog
