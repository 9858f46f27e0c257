#include <labelkit/context.h>

namespace labelkit {

Condition Condition::fieldEquals(std::string field, std::string value) {
    Condition c = make<Fields>([field, value](const Fields& fields) {
        auto it = fields.find(field);
        return it != fields.end() && it->second == value;
    });
    c._fieldMatch = FieldMatch{std::move(field), std::move(value)};
    return c;
}

} // namespace labelkit
