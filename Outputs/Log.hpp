//
//  Log.hpp
//  Trichrome
//
//  Created by Thomas Harte on 18/06/2018.
//  Copyright © 2018 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <string>

namespace Log {

enum class Source {
	FrameLoop,
	OpenGL,
	Resources,
	Shader,
	Window,
};

enum class EnabledLevel {
	None,				// No logged statements are presented.
	Errors,				// The error stream is presented, but not the info stream.
	ErrorsAndInfo,		// All streams are presented.
};

constexpr EnabledLevel enabled_level(const Source source) {
#ifdef NDEBUG
	return EnabledLevel::None;
#endif

	// Allow for compile-time source-level enabling and disabling of different sources.
	switch(source) {
		default:
			return EnabledLevel::ErrorsAndInfo;

		// Per-frame chatter is rarely wanted.
		case Source::FrameLoop:
			return EnabledLevel::Errors;
	}
}

constexpr const char *prefix(const Source source) {
	switch(source) {
		case Source::FrameLoop:		return "Frame loop";
		case Source::OpenGL:		return "OpenGL";
		case Source::Resources:		return "Resources";
		case Source::Shader:		return "Shader";
		case Source::Window:		return "Window";
	}

	return nullptr;
}

template <Source source, bool enabled>
struct LogLine;

/*!
	Holds the most recent line logged on this thread until a different line arrives, so that
	runs of identical lines can be printed once with a repeat count.
*/
struct RepeatAccumulator {
	std::string last;
	Source source;

	size_t count = 0;
	FILE *stream = nullptr;

	~RepeatAccumulator() {
		flush();
	}

	/// Extends the current run if @c line repeats it; otherwise prints the run and starts a new one.
	void accumulate(const std::string &line, const Source line_source, FILE *const line_stream) {
		if(count && line == last && line_source == source && line_stream == stream) {
			++count;
			return;
		}

		flush();
		last = line;
		source = line_source;
		stream = line_stream;
		count = 1;
	}

	void flush() {
		if(!count) return;

		const char *const unadorned_prefix = prefix(source);
		std::string line_prefix;
		if(unadorned_prefix) {
			line_prefix = "[";
			line_prefix += unadorned_prefix;
			line_prefix += "] ";
		}

		if(count > 1) {
			fprintf(stream, "%s%s [* %zu]\n", line_prefix.c_str(), last.c_str(), count);
		} else {
			fprintf(stream, "%s%s\n", line_prefix.c_str(), last.c_str());
		}
		fflush(stream);

		count = 0;
		last.clear();
	}
};

struct AccumulatingLog {
	inline static thread_local RepeatAccumulator accumulator_;
};

/// Prints any run of log lines still held back on this thread.
inline void flush() {
	AccumulatingLog::accumulator_.flush();
}

template <Source source>
struct LogLine<source, true>: private AccumulatingLog {
public:
	explicit LogLine(FILE *const stream) noexcept :
		stream_(stream) {}

	~LogLine() {
		accumulator_.accumulate(output_, source, stream_);
	}

	template <size_t size, typename... Args>
	auto &append(const char (&format)[size], Args... args) {
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat"
#pragma GCC diagnostic ignored "-Wformat-security"
		const auto append_size = std::snprintf(nullptr, 0, format, args...);
		const auto end = output_.size();
		output_.resize(output_.size() + size_t(append_size) + 1);
		std::snprintf(output_.data() + end, size_t(append_size) + 1, format, args...);
		output_.pop_back();
#pragma GCC diagnostic pop
		return *this;
	}

	template <size_t size, typename... Args>
	auto &append_if(const bool condition, const char (&format)[size], Args... args) {
		if(!condition) return *this;
		return append(format, args...);
	}

private:
	FILE *stream_;
	std::string output_;
};

template <Source source>
struct LogLine<source, false> {
	explicit LogLine(FILE *) noexcept {}

	template <size_t size, typename... Args>
	auto &append(const char (&)[size], Args...) { return *this; }

	template <size_t size, typename... Args>
	auto &append_if(bool, const char (&)[size], Args...) { return *this; }
};

template <Source source>
class Logger {
public:
	static constexpr bool InfoEnabled = enabled_level(source) == EnabledLevel::ErrorsAndInfo;
	static constexpr bool ErrorsEnabled = enabled_level(source) >= EnabledLevel::Errors;

	static auto info()	{	return LogLine<source, InfoEnabled>(stdout);	}
	static auto error()	{	return LogLine<source, ErrorsEnabled>(stderr);	}
};

}
