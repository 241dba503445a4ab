#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace arbor::catalog {

// Resources a tree can yield
enum class ResourceType : uint8_t {
    Timber,
    Sap,
    Fruit,
    Acorns
};

const char* resource_type_to_string(ResourceType type);

// Parse "timber", "sap", "fruit" or "acorns"
std::optional<ResourceType> resource_type_from_string(std::string_view name);

// One entry of a yield list
struct ResourceYield {
    ResourceType type = ResourceType::Timber;
    int amount = 0;

    bool operator==(const ResourceYield&) const = default;
};

} // namespace arbor::catalog
