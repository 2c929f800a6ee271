//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/serializer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/exception.hpp"
#include "tessera/common/helper.hpp"
#include "tessera/common/optional_ptr.hpp"
#include "tessera/common/protocol_version.hpp"

#include <type_traits>

namespace tessera {

class Logger;

//! The Serializer class is a base class that can be used to serialize objects into a binary buffer.
//! Every serializer is bound to the protocol version of the peer that reads the stream; writers consult
//! it to decide which version-gated fields are emitted.
class Serializer {
public:
	virtual ~Serializer() {
	}

	virtual void WriteData(const_data_ptr_t buffer, idx_t write_size) = 0;

	template <class T>
	void Write(T element) {
		static_assert(std::is_trivially_destructible<T>(), "Write element must be trivially destructible");

		WriteData(const_data_ptr_cast(&element), sizeof(T));
	}

	//! Write data from a string buffer directly (without length prefix)
	void WriteBufferData(const string &str) {
		WriteData(const_data_ptr_cast(str.c_str()), str.size());
	}
	//! Write a string with a length prefix
	void WriteString(const string &val) {
		Write<uint32_t>((uint32_t)val.size());
		if (!val.empty()) {
			WriteBufferData(val);
		}
	}
	void WriteStringVector(const vector<string> &list) {
		Write<uint32_t>((uint32_t)list.size());
		for (auto &child : list) {
			WriteString(child);
		}
	}
	//! Writes a count followed by every element of the list
	template <class T>
	void WriteList(const vector<shared_ptr<T>> &list) {
		Write<int32_t>((int32_t)list.size());
		for (auto &child : list) {
			child->Serialize(*this);
		}
	}
	//! Writes a presence flag followed by the element, if there is one
	template <class T>
	void WriteOptional(const shared_ptr<T> &element) {
		Write<bool>(element ? true : false);
		if (element) {
			element->Serialize(*this);
		}
	}

	const ProtocolVersion &GetVersion() const {
		return version;
	}
	void SetVersion(ProtocolVersion version_p) {
		version = version_p;
	}

protected:
	ProtocolVersion version = ProtocolVersion::Latest();
};

//! The Deserializer class assists in deserializing a binary blob back into an
//! object
class Deserializer {
public:
	virtual ~Deserializer() {
	}

	//! Reads [read_size] bytes into the buffer
	virtual void ReadData(data_ptr_t buffer, idx_t read_size) = 0;
	//! The number of bytes consumed so far, used to point at the offending position in error messages
	virtual idx_t GetPosition() const = 0;
	//! The number of bytes left in the stream
	virtual idx_t RemainingSize() const = 0;

	template <class T>
	T Read() {
		T value;
		ReadData(data_ptr_cast(&value), sizeof(T));
		return value;
	}

	//! Reads a boolean, any byte other than 0 or 1 is rejected as corruption
	bool ReadBool();
	void ReadStringVector(vector<string> &list);

	//! Reads a count followed by that many elements; a negative count can only be produced by a broken writer
	template <class T>
	vector<shared_ptr<T>> ReadList() {
		auto position = GetPosition();
		auto count = Read<int32_t>();
		if (count < 0) {
			throw InternalException("Failed to deserialize: negative list length %d at position %d", count,
			                        position);
		}
		vector<shared_ptr<T>> result;
		for (int32_t i = 0; i < count; i++) {
			result.push_back(T::Deserialize(*this));
		}
		return result;
	}

	template <class T>
	shared_ptr<T> ReadOptional() {
		auto has_entry = ReadBool();
		if (has_entry) {
			return T::Deserialize(*this);
		}
		return nullptr;
	}

	const ProtocolVersion &GetVersion() const {
		return version;
	}
	void SetVersion(ProtocolVersion version_p) {
		version = version_p;
	}

	//! The logger the transport layer attached to this stream (if any)
	optional_ptr<Logger> GetLogger() const {
		return logger;
	}
	void SetLogger(optional_ptr<Logger> logger_p) {
		logger = logger_p;
	}

protected:
	ProtocolVersion version = ProtocolVersion::Latest();
	optional_ptr<Logger> logger;
};

template <>
string Deserializer::Read();

} // namespace tessera
