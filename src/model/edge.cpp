#include "lanmap/model/edge.hpp"

#include <utility>

namespace lanmap::model {

std::string make_edge_id(std::string_view a, std::string_view b) {
    if (b < a) {
        std::swap(a, b);
    }
    std::string id;
    id.reserve(a.size() + b.size() + 2);
    id.append(a);
    id.append("~~");
    id.append(b);
    return id;
}

std::string_view to_string(LinkType type) {
    switch (type) {
        case LinkType::Gateway:
            return "gateway";
        case LinkType::Mesh:
            return "mesh";
        case LinkType::Backbone:
            return "backbone";
        case LinkType::Infrastructure:
            return "infrastructure";
        case LinkType::Access:
            return "access";
    }
    return "mesh";
}

std::string_view to_string(EdgeStatus status) {
    return status == EdgeStatus::Active ? "active" : "inactive";
}

}  // namespace lanmap::model
