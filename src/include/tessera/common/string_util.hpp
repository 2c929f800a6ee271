//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/string_util.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"
#include "tessera/common/exception.hpp"

namespace tessera {

/**
 * String Utility Functions
 * Note that these are not the most efficient implementations (i.e., they copy
 * memory) and therefore they should only be used for debug messages and other
 * such things.
 */
class StringUtil {
public:
	static bool CharacterIsSpace(char c) {
		return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
	}
	static bool CharacterIsDigit(char c) {
		return c >= '0' && c <= '9';
	}
	static char CharacterToLower(char c) {
		if (c >= 'A' && c <= 'Z') {
			return c - ('A' - 'a');
		}
		return c;
	}
	static char CharacterToUpper(char c) {
		if (c >= 'a' && c <= 'z') {
			return c - ('a' - 'A');
		}
		return c;
	}

	//! Returns true if the target string starts with the given prefix
	static bool StartsWith(const string &str, const string &prefix);

	//! Split the input string based on newline char
	static vector<string> Split(const string &str, char delimiter);

	//! Join multiple strings into one string. Components are concatenated by the given separator
	static string Join(const vector<string> &input, const string &separator);

	template <class T>
	static string ToString(const vector<T> &input, const string &separator) {
		vector<string> input_list;
		for (auto &i : input) {
			input_list.push_back(i.ToString());
		}
		return StringUtil::Join(input_list, separator);
	}

	//! Join multiple items of container with given size, transformed to string
	//! using function, into one string using the given separator
	template <typename C, typename S, typename FUNC>
	static string Join(const C &input, S count, const string &separator, FUNC f) {
		std::string result;
		if (count > 0) {
			result += f(input[0]);
		}
		for (size_t i = 1; i < count; i++) {
			result += separator + f(input[i]);
		}
		return result;
	}

	//! Convert a string to uppercase
	static string Upper(const string &str);

	//! Convert a string to lowercase
	static string Lower(const string &str);

	//! Case insensitive equals
	static bool CIEquals(const string &l1, const string &l2);

	//! Format a string using printf semantics
	template <typename... ARGS>
	static string Format(const string &fmt_str, ARGS... params) {
		return Exception::ConstructMessage(fmt_str, params...);
	}

	//! Remove the whitespace at the start and end of a string
	static void Trim(string &str);

	//! Replace all occurrences of a substring with another string
	static string Replace(string source, const string &from, const string &to);

	//! Get the levenshtein distance from two strings
	static idx_t LevenshteinDistance(const string &s1, const string &s2, idx_t not_equal_penalty = 1);

	//! Returns the top n strings (sorted by the given levenshtein distance) below the threshold
	static vector<string> TopNLevenshtein(const vector<string> &strings, const string &target, idx_t n = 5,
	                                      idx_t threshold = 5);

	//! Formats a list of candidates ("\nmessage: "a", "b")
	static string CandidatesMessage(const vector<string> &candidates, const string &candidate = "Candidates");

	//! Generate an error message in the form of "{message_prefix}: nearest_string, nearest_string2, ...
	//! Equivalent to calling TopNLevenshtein followed by CandidatesMessage
	static string CandidatesErrorMessage(const vector<string> &strings, const string &target,
	                                     const string &message_prefix, idx_t n = 5);
};

} // namespace tessera
