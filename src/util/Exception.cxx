// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Exception.hxx"

static std::string
AppendNested(std::string &&msg, const std::exception &e,
	     const char *fallback, const char *separator) noexcept;

static std::string
AppendNested(std::string &&msg, std::exception_ptr ep,
	     const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		msg += separator;
		msg += e.what();
		return AppendNested(std::move(msg), e, fallback, separator);
	} catch (const char *s) {
		msg += separator;
		msg += s;
		return std::move(msg);
	} catch (...) {
		msg += separator;
		msg += fallback;
		return std::move(msg);
	}
}

static std::string
AppendNested(std::string &&msg, const std::exception &e,
	     const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
		return std::move(msg);
	} catch (...) {
		return AppendNested(std::move(msg), std::current_exception(),
				    fallback, separator);
	}
}

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
{
	return AppendNested(e.what(), e, fallback, separator);
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}
