#ifndef SEQ_CLOCK_HPP
#define SEQ_CLOCK_HPP

#include <ctime>

// Measures processor time consumed by the current process between
// start() and stop(); converts to seconds.
class Processor_clock {

	std::clock_t accumulated;
	std::clock_t started_at;
	bool running;

public:

	Processor_clock()
	: accumulated(0)
	, started_at(0)
	, running(false)
	{
	}

	void start()
	{
		started_at = std::clock();
		running = true;
	}

	double stop()
	{
		if (running) {
			accumulated += std::clock() - started_at;
			running = false;
		}
		return seconds();
	}

	void reset()
	{
		accumulated = 0;
		running = false;
	}

	double seconds() const
	{
		std::clock_t total = accumulated;
		if (running)
			total += std::clock() - started_at;
		return ((double) total) / CLOCKS_PER_SEC;
	}

	operator double() const
	{
		return seconds();
	}
};

#endif
