/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#ifndef APPOINTMENT_PLANNER_UTILS__IMPL_PTR_HPP
#define APPOINTMENT_PLANNER_UTILS__IMPL_PTR_HPP

#include <memory>
#include <type_traits>
#include <utility>

// A reduced form of the copyable pimpl pointer from
// https://github.com/oliora/samples/blob/master/spimpl.h
// Which uses the following boost license:
/*
    Copyright (c) 2015 Andrey Upadyshev (oliora@gmail.com)
    Distributed under the Boost Software License, Version 1.0.
    See http://www.boost.org/LICENSE_1_0.txt
 */

namespace appointment_planner_utils {
namespace details {

//==============================================================================
template<class T>
T* default_copy(const T* original)
{
  static_assert(sizeof(T) > 0 && !std::is_void<T>::value,
    "default_copy cannot copy an incomplete type");
  return new T(*original);
}

//==============================================================================
template<class T>
void default_delete(T* ptr)
{
  static_assert(sizeof(T) > 0 && !std::is_void<T>::value,
    "default_delete cannot delete an incomplete type");
  delete ptr;
}

} // namespace details

//==============================================================================
/// Owning pointer to the Implementation of a value type. Copying an impl_ptr
/// makes a deep copy of the Implementation, so classes that hold one keep
/// value semantics without spelling out their copy operations.
template<class T>
class impl_ptr
{
public:

  using pointer = T*;
  using const_pointer = const T*;
  using element_type = T;
  using deleter_type = void (*)(T*);
  using copier_type = T* (*)(const T*);

  impl_ptr() noexcept
  : _ptr(nullptr, &details::default_delete<T>),
    _copier(&details::default_copy<T>)
  {
    // Do nothing
  }

  impl_ptr(pointer p, deleter_type deleter, copier_type copier) noexcept
  : _ptr(p, deleter),
    _copier(copier)
  {
    // Do nothing
  }

  impl_ptr(const impl_ptr& other)
  : impl_ptr(other.clone())
  {
    // Do nothing
  }

  impl_ptr(impl_ptr&& other) noexcept = default;

  impl_ptr& operator=(const impl_ptr& other)
  {
    if (this != &other)
      *this = other.clone();

    return *this;
  }

  impl_ptr& operator=(impl_ptr&& other) noexcept = default;

  T& operator*() { return *_ptr; }
  const T& operator*() const { return *_ptr; }

  pointer operator->() noexcept { return _ptr.get(); }
  const_pointer operator->() const noexcept { return _ptr.get(); }

  pointer get() noexcept { return _ptr.get(); }
  const_pointer get() const noexcept { return _ptr.get(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_ptr); }

  /// Make an independent deep copy. Cloning an empty pointer gives an empty
  /// pointer.
  impl_ptr clone() const
  {
    return impl_ptr(
      _ptr ? _copier(_ptr.get()) : nullptr,
      _ptr.get_deleter(),
      _copier);
  }

private:
  std::unique_ptr<T, deleter_type> _ptr;
  copier_type _copier;
};

//==============================================================================
template<class T, class... Args>
inline impl_ptr<T> make_impl(Args&& ... args)
{
  return impl_ptr<T>(
    new T(std::forward<Args>(args)...),
    &details::default_delete<T>,
    &details::default_copy<T>);
}

} // namespace appointment_planner_utils

#endif // APPOINTMENT_PLANNER_UTILS__IMPL_PTR_HPP
