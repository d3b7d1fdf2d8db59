/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <dsched/chain/name.hpp>

#include <boost/algorithm/string.hpp>
#include <fc/variant.hpp>

#include <dsched/chain/exceptions.hpp>

namespace dsched { namespace chain {

void
name::set(std::string_view str) {
    DSCHED_ASSERT2(str.size() <= 13, name_type_exception, "Name is longer than 13 characters ({})", std::string(str));
    value = string_to_uint64_t(str);
    DSCHED_ASSERT2(to_string() == str, name_type_exception,
        "Name not properly normalized (name: {}, normalized: {})", std::string(str), to_string());
}

std::string
name::to_string() const {
    static const char* charmap = ".12345abcdefghijklmnopqrstuvwxyz";

    auto str = std::string(13, '.');
    auto tmp = value;
    for(uint32_t i = 0; i <= 12; ++i) {
        char c      = charmap[tmp & (i == 0 ? 0x0f : 0x1f)];
        str[12 - i] = c;
        tmp >>= (i == 0 ? 4 : 5);
    }

    boost::algorithm::trim_right_if(str, [](char c) { return c == '.'; });
    return str;
}

}}  // namespace dsched::chain

namespace fc {

void
to_variant(const dsched::chain::name& n, fc::variant& v) {
    v = n.to_string();
}

void
from_variant(const fc::variant& v, dsched::chain::name& n) {
    n = dsched::chain::name(v.get_string());
}

}  // namespace fc
