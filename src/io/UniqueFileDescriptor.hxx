// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <utility>

#include <sys/types.h>

/**
 * An OO wrapper for a file descriptor which closes it in the
 * destructor.
 */
class UniqueFileDescriptor {
	int fd = -1;

public:
	UniqueFileDescriptor() noexcept = default;

	explicit UniqueFileDescriptor(int _fd) noexcept
		:fd(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:fd(std::exchange(other.fd, -1)) {}

	~UniqueFileDescriptor() noexcept {
		Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	/**
	 * Give up ownership.  The caller is responsible for closing the
	 * returned file descriptor.
	 */
	int Release() noexcept {
		return std::exchange(fd, -1);
	}

	void Close() noexcept;

	/**
	 * Throws on error.
	 */
	void SetNonBlocking();

	ssize_t Read(void *buffer, std::size_t length) const noexcept;
	ssize_t Write(const void *buffer, std::size_t length) const noexcept;

	/**
	 * Create a pipe with O_CLOEXEC on both ends.
	 *
	 * Throws on error.
	 */
	static std::pair<UniqueFileDescriptor, UniqueFileDescriptor> CreatePipe();
};
