#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace utfjson
{

template<typename ...Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};
template<typename ...Fs> overloaded(Fs...) -> overloaded<Fs...>;

template<typename T>
struct is_pair : std::false_type {};
template<typename A, typename B>
struct is_pair<std::pair<A, B>> : std::true_type {};

// Visits a variant; std::pair alternatives are unpacked into two handler arguments.
template<typename ...Ts, typename ...Fs>
decltype(auto) match(std::variant<Ts...>&& v, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	return std::visit([&]<typename X>(X&& x) -> decltype(auto) {
		if constexpr (is_pair<std::remove_cvref_t<X>>::value)
			return overload(std::move(x.first), std::move(x.second));
		else
			return overload(std::move(x));
	}, std::move(v));
}
template<typename ...Ts, typename ...Fs>
decltype(auto) match(const std::variant<Ts...>& v, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	return std::visit([&]<typename X>(const X& x) -> decltype(auto) {
		if constexpr (is_pair<X>::value)
			return overload(x.first, x.second);
		else
			return overload(x);
	}, v);
}

// Same for an optional pair; the empty case is dispatched as std::nullopt.
template<typename A, typename B, typename ...Fs>
decltype(auto) match(const std::optional<std::pair<A, B>>& o, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	if (not o.has_value()) return overload(std::nullopt);
	return overload(o->first, o->second);
}

}
