#pragma once
#include <algorithm>
#include <chrono>
#include <map>
#include <string>

struct TimerStats {
	float lastTimeMs = 0.0f;
	float totalTimeMs = 0.0f;
	float averageTimeMs = 0.0f;
	float maxTimeMs = 0.0f;

	int tickCount = 0;

	void addSample(float timeMs) {
		lastTimeMs = timeMs;
		totalTimeMs += timeMs;
		maxTimeMs = std::max(maxTimeMs, timeMs);
		tickCount++;
	}

	void finalizeFrame() {
		if (tickCount > 0)
			averageTimeMs = totalTimeMs / tickCount;
	}

	void resetFrame() {
		tickCount = 0;
		totalTimeMs = 0.0f;
	}
};


// Collects named CPU timings; the UI draws them once per frame
class TimerManager {
public:
	static TimerManager& instance() {
		static TimerManager inst;
		return inst;
	}

	void addSample(const std::string& name, float timeMs) {
		timers[name].addSample(timeMs);
	}

	void finalizeFrame() {
		for (auto& [_, timer] : timers)
		{
			timer.finalizeFrame();
		}
	}

	void resetFrame() {
		for (auto& [_, timer] : timers)
		{
			timer.resetFrame();
		}
	}

	std::map<std::string, TimerStats>& getTimers() { return timers; }

private:
	std::map<std::string, TimerStats> timers;
};

class TimerCPU {
public:
	explicit TimerCPU(const char* name) : name(name) {
		start = std::chrono::high_resolution_clock::now();
	}

	~TimerCPU() {
		auto end = std::chrono::high_resolution_clock::now();
		float ms = std::chrono::duration<float, std::milli>(end - start).count();
		TimerManager::instance().addSample(name, ms);
	}

	TimerCPU(const TimerCPU&) = delete;
	TimerCPU& operator=(const TimerCPU&) = delete;

private:
	const char* name;
	std::chrono::high_resolution_clock::time_point start;
};
