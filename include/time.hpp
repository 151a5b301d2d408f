#ifndef SEQ_TIME_HPP
#define SEQ_TIME_HPP

#include <limits>

// discrete time, counted in days
typedef long long dtime_t;

namespace Time_model {

	template<class T>
	struct constants
	{
		static constexpr T infinity()
		{
			return std::numeric_limits<T>::max();
		}
	};

	// Bounds derived from infinity() are shifted by durations and margins,
	// so it must stay far away from overflow.
	template<>
	struct constants<dtime_t>
	{
		static constexpr dtime_t infinity()
		{
			return std::numeric_limits<dtime_t>::max() / 4;
		}
	};
}

#endif
