#include "storyline/named_entity.hpp"

namespace storyline {

const char *entity_type_name(EntityType type) {
    switch (type) {
    case EntityType::Unset:
        return "Unset";
    case EntityType::Person:
        return "Person";
    case EntityType::Loc:
        return "Loc";
    case EntityType::Org:
        return "Org";
    case EntityType::Year:
        return "Year";
    case EntityType::YearPerhaps:
        return "YearPerhaps";
    case EntityType::SomethingToIgnore:
        return "SomethingToIgnore";
    case EntityType::SomethingElse:
        return "SomethingElse";
    }
    return "Unset";
}

} // namespace storyline
