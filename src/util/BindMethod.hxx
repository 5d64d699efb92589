// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <type_traits>
#include <utility>

/**
 * A type-erased callback which invokes a method on an object,
 * without allocating memory.  This is cheaper than std::function,
 * but can only bind a member function and its instance pointer.
 */
template<typename S=void()>
class BoundMethod;

template<typename R, typename... Args>
class BoundMethod<R(Args...)> {
	using Function = R(*)(void *instance, Args... args);

	void *instance_;
	Function function;

public:
	BoundMethod() = default;

	constexpr BoundMethod(void *_instance, Function _function) noexcept
		:instance_(_instance), function(_function) {}

	/**
	 * Construct an "undefined" object.  It must not be called,
	 * and its "bool" operator returns false.
	 */
	BoundMethod(std::nullptr_t n) noexcept:function(n) {}

	/**
	 * Was this object initialized with a valid function pointer?
	 */
	operator bool() const noexcept {
		return function != nullptr;
	}

	R operator()(Args... args) const {
		return function(instance_, std::forward<Args>(args)...);
	}
};

namespace BindMethodDetail {

template<typename M>
struct MethodTraits;

template<typename R, typename T, typename... Args>
struct MethodTraits<R (T::*)(Args...)> {
	using Class = T;
	using Signature = R(Args...);

	template<R (T::*method)(Args...)>
	static R Invoke(void *instance, Args... args) {
		return (static_cast<T *>(instance)->*method)(std::forward<Args>(args)...);
	}
};

template<typename R, typename T, typename... Args>
struct MethodTraits<R (T::*)(Args...) noexcept> {
	using Class = T;
	using Signature = R(Args...);

	template<R (T::*method)(Args...) noexcept>
	static R Invoke(void *instance, Args... args) {
		return (static_cast<T *>(instance)->*method)(std::forward<Args>(args)...);
	}
};

} // namespace BindMethodDetail

/**
 * Construct a #BoundMethod instance for the given member function
 * and instance.
 */
template<auto method>
auto
BindMethod(typename BindMethodDetail::MethodTraits<decltype(method)>::Class &instance) noexcept
{
	using Traits = BindMethodDetail::MethodTraits<decltype(method)>;
	using Signature = typename Traits::Signature;

	return BoundMethod<Signature>(&instance,
				      &Traits::template Invoke<method>);
}

#define BIND_METHOD(instance, method) \
	BindMethod<method>(instance)

/**
 * Shortcut macro which takes an instance and a method name and
 * constructs a #BoundMethod instance bound to "this".
 */
#define BIND_THIS_METHOD(method) \
	BIND_METHOD(*this, &std::remove_reference_t<decltype(*this)>::method)
