// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include <chrono>

namespace teaty {

class Clock {
public:
	using time_point = std::chrono::steady_clock::time_point;

	virtual ~Clock() = default;
	virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
	time_point now() const override { return std::chrono::steady_clock::now(); }
};

} // namespace teaty
