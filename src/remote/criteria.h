#ifndef PUSHLINE_REMOTE_CRITERIA_H_
#define PUSHLINE_REMOTE_CRITERIA_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model.h"

namespace Pushline {

/**
 * Search predicate understood by RemoteClient.
 *
 * Immutable value type; copies share the underlying tree.
 *
 *   Criteria::And({Criteria::WithUnitType(UnitType::kRpm),
 *                  Criteria::Or({Criteria::WithField("sha256sum", a),
 *                                Criteria::WithField("sha256sum", b)})})
 */
class Criteria {
public:
    static Criteria True();
    static Criteria WithUnitType(UnitType type);
    static Criteria WithField(std::string field, std::string value);
    static Criteria WithFieldIn(std::string field, std::vector<std::string> values);
    static Criteria WithId(std::vector<std::string> ids);
    static Criteria And(std::vector<Criteria> operands);
    static Criteria Or(std::vector<Criteria> operands);

    bool Matches(const Unit& unit) const;
    bool Matches(const Repository& repo) const;

    std::string DebugString() const;

private:
    struct Node;
    using FieldLookup = std::function<std::optional<std::string>(std::string_view)>;

    explicit Criteria(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    static bool Eval(const Node& node, const FieldLookup& lookup, std::optional<UnitType> type);

    std::shared_ptr<const Node> node_;
};

} // namespace Pushline

#endif // PUSHLINE_REMOTE_CRITERIA_H_
