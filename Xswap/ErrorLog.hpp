#ifndef XSWAP_ERRORLOG_HPP
#define XSWAP_ERRORLOG_HPP

#include<cstddef>
#include<cstdint>
#include<deque>
#include<string>
#include<vector>

namespace Xswap {

/** struct Xswap::ErrorRecord
 *
 * @brief an operational error or warning, with
 * optional order and chain context (empty when not
 * applicable).
 */
struct ErrorRecord {
	enum Level
	{ Error
	, Warning
	, Info
	};
	std::uint64_t timestamp;
	Level level;
	std::string message;
	std::string order_id;
	std::string chain;
};

char const* to_string(ErrorRecord::Level);

/** class Xswap::ErrorLog
 *
 * @brief bounded, append-only record of operational
 * errors; when full the oldest entry is evicted.
 */
class ErrorLog {
private:
	std::size_t cap;
	std::deque<ErrorRecord> records;

public:
	static constexpr std::size_t default_capacity = 1000;

	explicit
	ErrorLog(std::size_t capacity = default_capacity);

	void add( std::uint64_t timestamp
		, ErrorRecord::Level level
		, std::string message
		, std::string order_id = ""
		, std::string chain = ""
		);

	/* The newest `n` records, oldest first.  */
	std::vector<ErrorRecord> recent(std::size_t n) const;
	std::vector<ErrorRecord> all() const;
	std::size_t size() const { return records.size(); }
	std::size_t capacity() const { return cap; }
};

}

#endif /* !defined(XSWAP_ERRORLOG_HPP) */
