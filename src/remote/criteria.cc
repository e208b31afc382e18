#include "criteria.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace Pushline {

struct Criteria::Node {
    enum class Kind { kTrue, kUnitType, kField, kFieldIn, kAnd, kOr };

    Kind kind = Kind::kTrue;
    UnitType unit_type = UnitType::kFile;
    std::string field;
    std::vector<std::string> values;
    std::vector<Criteria> operands;
};

Criteria Criteria::True() {
    return Criteria(std::make_shared<const Node>());
}

Criteria Criteria::WithUnitType(UnitType type) {
    auto node = std::make_shared<Node>();
    node->kind = Node::Kind::kUnitType;
    node->unit_type = type;
    return Criteria(std::move(node));
}

Criteria Criteria::WithField(std::string field, std::string value) {
    auto node = std::make_shared<Node>();
    node->kind = Node::Kind::kField;
    node->field = std::move(field);
    node->values.push_back(std::move(value));
    return Criteria(std::move(node));
}

Criteria Criteria::WithFieldIn(std::string field, std::vector<std::string> values) {
    auto node = std::make_shared<Node>();
    node->kind = Node::Kind::kFieldIn;
    node->field = std::move(field);
    node->values = std::move(values);
    return Criteria(std::move(node));
}

Criteria Criteria::WithId(std::vector<std::string> ids) {
    return WithFieldIn("id", std::move(ids));
}

Criteria Criteria::And(std::vector<Criteria> operands) {
    auto node = std::make_shared<Node>();
    node->kind = Node::Kind::kAnd;
    node->operands = std::move(operands);
    return Criteria(std::move(node));
}

Criteria Criteria::Or(std::vector<Criteria> operands) {
    auto node = std::make_shared<Node>();
    node->kind = Node::Kind::kOr;
    node->operands = std::move(operands);
    return Criteria(std::move(node));
}

bool Criteria::Eval(const Node& node, const FieldLookup& lookup, std::optional<UnitType> type) {
    switch (node.kind) {
        case Node::Kind::kTrue:
            return true;
        case Node::Kind::kUnitType:
            return type.has_value() && *type == node.unit_type;
        case Node::Kind::kField:
        case Node::Kind::kFieldIn: {
            auto value = lookup(node.field);
            if (!value) {
                return false;
            }
            return std::find(node.values.begin(), node.values.end(), *value) != node.values.end();
        }
        case Node::Kind::kAnd:
            for (const auto& op : node.operands) {
                if (!Eval(*op.node_, lookup, type)) return false;
            }
            return true;
        case Node::Kind::kOr:
            for (const auto& op : node.operands) {
                if (Eval(*op.node_, lookup, type)) return true;
            }
            return false;
    }
    return false;
}

bool Criteria::Matches(const Unit& unit) const {
    return Eval(*node_, [&unit](std::string_view f) { return unit.Field(f); }, unit.type);
}

bool Criteria::Matches(const Repository& repo) const {
    return Eval(*node_, [&repo](std::string_view f) { return repo.Field(f); }, std::nullopt);
}

std::string Criteria::DebugString() const {
    const Node& node = *node_;
    auto join_operands = [&node](std::string_view op) {
        std::vector<std::string> parts;
        parts.reserve(node.operands.size());
        for (const auto& operand : node.operands) {
            parts.push_back(operand.DebugString());
        }
        return absl::StrCat(std::string(op), "(", absl::StrJoin(parts, ", "), ")");
    };
    switch (node.kind) {
        case Node::Kind::kTrue:
            return "true";
        case Node::Kind::kUnitType:
            return absl::StrCat("type=", std::string(UnitTypeName(node.unit_type)));
        case Node::Kind::kField:
            return absl::StrCat(node.field, "=", node.values.front());
        case Node::Kind::kFieldIn:
            return absl::StrCat(node.field, " in [", absl::StrJoin(node.values, ", "), "]");
        case Node::Kind::kAnd:
            return join_operands("and");
        case Node::Kind::kOr:
            return join_operands("or");
    }
    return "?";
}

} // namespace Pushline
