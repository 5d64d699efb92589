// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * Splits a byte stream into lines.  Partial lines are kept until the
 * rest arrives; a trailing carriage return is removed and empty lines
 * are skipped.
 */
class LineSplitter {
	const std::size_t max_length;

	std::string partial;

public:
	/**
	 * Thrown by Feed() if a line is longer than the configured
	 * maximum.
	 */
	class TooLong : public std::length_error {
	public:
		TooLong() noexcept:std::length_error("Line too long") {}
	};

	explicit LineSplitter(std::size_t _max_length) noexcept
		:max_length(_max_length) {}

	/**
	 * Consume a chunk of data and invoke the callback for each
	 * complete non-empty line (without the line terminator).
	 *
	 * Throws #TooLong if a line exceeds the maximum length; other
	 * exceptions thrown by the callback are propagated.
	 */
	template<typename F>
	void Feed(std::string_view data, F &&f) {
		while (!data.empty()) {
			const auto newline = data.find('\n');
			if (newline == data.npos) {
				Append(data);
				break;
			}

			Append(data.substr(0, newline));
			data.remove_prefix(newline + 1);

			std::string line = std::move(partial);
			partial.clear();

			if (!line.empty() && line.back() == '\r')
				line.pop_back();

			if (line.size() > max_length)
				throw TooLong();

			if (!line.empty())
				f(std::move(line));
		}
	}

	/**
	 * The stream has ended.  An unterminated line is discarded.
	 *
	 * @return the number of discarded bytes
	 */
	std::size_t Finish() noexcept {
		const std::size_t size = partial.size();
		partial.clear();
		return size;
	}

private:
	void Append(std::string_view data) {
		/* one extra byte for a trailing carriage return */
		if (partial.size() + data.size() > max_length + 1)
			throw TooLong();

		partial.append(data);
	}
};
