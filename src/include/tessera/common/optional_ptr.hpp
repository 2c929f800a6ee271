//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/optional_ptr.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/exception.hpp"

namespace tessera {

//! A non-owning pointer that may be null; dereferencing a null optional_ptr throws
template <class T>
class optional_ptr { // NOLINT: mimic std casing
public:
	optional_ptr() : ptr(nullptr) {
	}
	optional_ptr(T *ptr_p) : ptr(ptr_p) { // NOLINT: allow implicit creation from pointer
	}
	optional_ptr(T &ref) : ptr(&ref) { // NOLINT: allow implicit creation from reference
	}
	optional_ptr(const unique_ptr<T> &ptr_p) : ptr(ptr_p.get()) { // NOLINT: allow implicit creation from unique pointer
	}
	optional_ptr(const shared_ptr<T> &ptr_p) : ptr(ptr_p.get()) { // NOLINT: allow implicit creation from shared pointer
	}

	void CheckValid() const {
		if (!ptr) {
			throw InternalException("Attempting to dereference an optional pointer that is not set");
		}
	}

	operator bool() const { // NOLINT: allow implicit conversion to bool
		return ptr;
	}
	T &operator*() const {
		CheckValid();
		return *ptr;
	}
	T *operator->() const {
		CheckValid();
		return ptr;
	}
	T *get() const { // NOLINT: mimic std casing
		return ptr;
	}
	bool operator==(const optional_ptr<T> &rhs) const {
		return ptr == rhs.ptr;
	}
	bool operator!=(const optional_ptr<T> &rhs) const {
		return ptr != rhs.ptr;
	}

private:
	T *ptr;
};

} // namespace tessera
