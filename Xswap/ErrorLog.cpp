#include"Xswap/ErrorLog.hpp"

namespace Xswap {

constexpr std::size_t ErrorLog::default_capacity;

char const* to_string(ErrorRecord::Level l) {
	switch (l) {
	case ErrorRecord::Error: return "error";
	case ErrorRecord::Warning: return "warning";
	case ErrorRecord::Info: return "info";
	}
	return "unknown";
}

ErrorLog::ErrorLog(std::size_t capacity) : cap(capacity) { }

void ErrorLog::add( std::uint64_t timestamp
		  , ErrorRecord::Level level
		  , std::string message
		  , std::string order_id
		  , std::string chain
		  ) {
	if (cap == 0)
		return;
	while (records.size() >= cap)
		records.pop_front();
	records.push_back(ErrorRecord{
		timestamp, level, std::move(message),
		std::move(order_id), std::move(chain)
	});
}

std::vector<ErrorRecord> ErrorLog::recent(std::size_t n) const {
	if (n > records.size())
		n = records.size();
	return std::vector<ErrorRecord>( records.end() - n
				       , records.end()
				       );
}
std::vector<ErrorRecord> ErrorLog::all() const {
	return std::vector<ErrorRecord>(records.begin(), records.end());
}

}
