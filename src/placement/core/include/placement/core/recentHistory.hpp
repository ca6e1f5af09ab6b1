#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <iterator>
#include <numeric>
#include <optional>

namespace tabletop::placement::core {

/*! Trailing window of the most recent values with an arithmetic mean.
 *  Pushing past the capacity drops the oldest value first.
 *  T must support `T + T` and `T / float` (float, cv::Vec3f, ...).
 */
template <typename T>
class RecentHistory {
public:
	using const_iterator = typename std::deque<T>::const_iterator;

	explicit RecentHistory(std::size_t capacity) : m_capacity{std::max<std::size_t>(1u, capacity)} {
	}

	void push(const T& value) {
		m_values.push_back(value);
		while (m_values.size() > m_capacity) {
			m_values.pop_front();
		}
	}

	//! Mean of all stored values. Null if nothing was pushed yet.
	std::optional<T> mean() const {
		if (m_values.empty()) {
			return std::nullopt;
		}
		const T sum = std::accumulate(std::next(m_values.begin()), m_values.end(), m_values.front());
		return sum / static_cast<float>(m_values.size());
	}

	//! Rewrite every stored value in place. Order and size are kept.
	template <typename Fn>
	void remap(Fn&& fn) {
		for (T& value: m_values) {
			value = fn(value);
		}
	}

	void clear() {
		m_values.clear();
	}

	std::size_t size() const {
		return m_values.size();
	}
	std::size_t capacity() const {
		return m_capacity;
	}
	bool empty() const {
		return m_values.empty();
	}

	const T& oldest() const {
		return m_values.front();
	}
	const T& newest() const {
		return m_values.back();
	}

	const_iterator begin() const {
		return m_values.begin();
	}
	const_iterator end() const {
		return m_values.end();
	}

	bool operator==(const RecentHistory& other) const = default;

private:
	std::size_t m_capacity; //!< Maximum number of values kept.
	std::deque<T> m_values; //!< Oldest first.
};

} // namespace tabletop::placement::core
