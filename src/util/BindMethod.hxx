// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_UTIL_BIND_METHOD_HXX
#define MILO_UTIL_BIND_METHOD_HXX

#include <type_traits>
#include <utility>

/**
 * A callback to a method of a specific object: an untyped object
 * pointer plus a generated thunk which casts it back and calls the
 * method.  Unlike std::function, it never allocates.
 */
template<typename S>
class BoundMethod;

template<typename R, bool NoExcept, typename... Args>
class BoundMethod<R(Args...) noexcept(NoExcept)> {
public:
	using Thunk = R (*)(void *object, Args... args) noexcept(NoExcept);

private:
	void *object = nullptr;
	Thunk thunk = nullptr;

public:
	BoundMethod() = default;

	constexpr BoundMethod(void *_object, Thunk _thunk) noexcept
		:object(_object), thunk(_thunk) {}

	constexpr explicit operator bool() const noexcept {
		return thunk != nullptr;
	}

	R operator()(Args... args) const noexcept(NoExcept) {
		return thunk(object, std::forward<Args>(args)...);
	}
};

namespace BindMethodDetail {

template<auto method, typename M=decltype(method)>
struct MethodTraits;

template<auto method, typename T, typename R, bool NoExcept,
	 typename... Args>
struct MethodTraits<method, R (T::*)(Args...) noexcept(NoExcept)> {
	using Class = T;
	using Bound = BoundMethod<R(Args...) noexcept(NoExcept)>;

	static R Call(void *object, Args... args) noexcept(NoExcept) {
		return (static_cast<T *>(object)->*method)(std::forward<Args>(args)...);
	}
};

} // namespace BindMethodDetail

template<auto method>
constexpr auto
BindMethod(typename BindMethodDetail::MethodTraits<method>::Class &object) noexcept
{
	using Traits = BindMethodDetail::MethodTraits<method>;
	return typename Traits::Bound{&object, &Traits::Call};
}

/**
 * Bind a method of the current object, e.g.
 * BIND_THIS_METHOD(OnSocketReady).
 */
#define BIND_THIS_METHOD(method) \
	BindMethod<&std::remove_reference_t<decltype(*this)>::method>(*this)

#endif
