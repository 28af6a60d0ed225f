#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Db.hpp"
#include<cstdint>
#include<string>

namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement: bind parameters, then
 * step through its rows.
 *
 * @desc Named parameters are of the form :VVV.
 * Binding an unknown name throws.
 * `step()` runs the statement up to the next row,
 * returning false once there are no more rows; a
 * statement without results needs a single `step()`.
 */
class Query {
private:
	Sqlite3::Db db;
	void* stmt;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

	int location(char const*) const;

public:
	Query() =delete;
	Query(Query const&) =delete;
	Query(Query&&);
	~Query();

	Query& bind(char const* field, std::int64_t value);
	Query& bind(char const* field, std::uint64_t value) {
		return bind(field, std::int64_t(value));
	}
	Query& bind(char const* field, std::string const& value);

	bool step();

	/* Column accessors for the current row.  */
	std::int64_t column_i(int c) const;
	std::uint64_t column_u(int c) const {
		return std::uint64_t(column_i(c));
	}
	std::string column_s(int c) const;
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
