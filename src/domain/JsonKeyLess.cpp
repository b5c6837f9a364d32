#include "domain/JsonKeyLess.hpp"

#include <algorithm>
#include <cstdint>

namespace depcache::domain {

namespace {

int kindRank(const nlohmann::json& value) {
    using value_t = nlohmann::json::value_t;
    switch (value.type()) {
        case value_t::null:            return 0;
        case value_t::boolean:         return 1;
        case value_t::number_integer:
        case value_t::number_unsigned: return 2;
        case value_t::number_float:    return 3;
        case value_t::string:          return 4;
        case value_t::array:           return 5;
        case value_t::object:          return 6;
        case value_t::binary:          return 7;
        default:                       return 8;
    }
}

bool integerLess(const nlohmann::json& lhs, const nlohmann::json& rhs) {
    bool lhsUnsigned = lhs.is_number_unsigned();
    bool rhsUnsigned = rhs.is_number_unsigned();

    if (!lhsUnsigned && !rhsUnsigned) {
        return lhs.get<int64_t>() < rhs.get<int64_t>();
    }
    if (lhsUnsigned && rhsUnsigned) {
        return lhs.get<uint64_t>() < rhs.get<uint64_t>();
    }
    if (lhsUnsigned) {
        int64_t signedRhs = rhs.get<int64_t>();
        return signedRhs >= 0 && lhs.get<uint64_t>() < static_cast<uint64_t>(signedRhs);
    }
    int64_t signedLhs = lhs.get<int64_t>();
    return signedLhs < 0 || static_cast<uint64_t>(signedLhs) < rhs.get<uint64_t>();
}

} // namespace

bool JsonKeyLess::operator()(const nlohmann::json& lhs, const nlohmann::json& rhs) const {
    int lhsRank = kindRank(lhs);
    int rhsRank = kindRank(rhs);
    if (lhsRank != rhsRank) {
        return lhsRank < rhsRank;
    }

    switch (lhsRank) {
        case 0:
            return false;
        case 1:
            return lhs.get<bool>() < rhs.get<bool>();
        case 2:
            return integerLess(lhs, rhs);
        case 3:
            return lhs.get<double>() < rhs.get<double>();
        case 4:
            return lhs.get_ref<const std::string&>() < rhs.get_ref<const std::string&>();
        case 5:
            return std::lexicographical_compare(
                lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), *this);
        case 6: {
            // Члены объекта уже упорядочены по имени
            auto l = lhs.begin();
            auto r = rhs.begin();
            for (; l != lhs.end() && r != rhs.end(); ++l, ++r) {
                if (l.key() != r.key()) {
                    return l.key() < r.key();
                }
                if ((*this)(l.value(), r.value())) {
                    return true;
                }
                if ((*this)(r.value(), l.value())) {
                    return false;
                }
            }
            return l == lhs.end() && r != rhs.end();
        }
        default:
            return lhs < rhs;
    }
}

} // namespace depcache::domain
