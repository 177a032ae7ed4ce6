#ifndef JWTGATE_CORE_OPTIONAL_H
#define JWTGATE_CORE_OPTIONAL_H

// jwtgate is built as C++17; optional and variant resolve to the standard
// library types under the project namespace so headers stay uniform.

#include <optional>
#include <variant>

namespace jwtgate {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace jwtgate

#endif  // JWTGATE_CORE_OPTIONAL_H
