#include"Sqlite3/Query.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace {

void check_bind(int res) {
	if (res != SQLITE_OK)
		throw std::runtime_error(
			"Sqlite3::Query: bind error."
		);
}

}

namespace Sqlite3 {

Query::Query( Sqlite3::Db const& db_
	    , void* stmt_
	    ) : db(db_), stmt(stmt_) { }
Query::Query(Query&& o) : db(o.db), stmt(o.stmt) {
	o.stmt = nullptr;
}
Query::~Query() {
	if (stmt)
		(void) sqlite3_finalize((sqlite3_stmt*) stmt);
}

int Query::location(char const* field) const {
	auto res = sqlite3_bind_parameter_index((sqlite3_stmt*) stmt, field);
	if (res == 0)
		throw std::runtime_error(
			std::string("Sqlite3::Query::bind: no field: ") + field
		);
	return res;
}

Query& Query::bind(char const* field, std::int64_t value) {
	check_bind(sqlite3_bind_int64( (sqlite3_stmt*) stmt
				     , location(field), value
				     ));
	return *this;
}
Query& Query::bind(char const* field, std::string const& value) {
	check_bind(sqlite3_bind_text( (sqlite3_stmt*) stmt
				    , location(field)
				    , value.c_str(), int(value.size())
				    , SQLITE_TRANSIENT
				    ));
	return *this;
}

bool Query::step() {
	auto res = sqlite3_step((sqlite3_stmt*) stmt);
	if (res == SQLITE_ROW)
		return true;
	if (res == SQLITE_DONE)
		return false;
	auto connection = (sqlite3*) db.get_connection();
	throw std::runtime_error(
		std::string("Sqlite3::Query: ") + sqlite3_errmsg(connection)
	);
}

std::int64_t Query::column_i(int c) const {
	return sqlite3_column_int64((sqlite3_stmt*) stmt, c);
}
std::string Query::column_s(int c) const {
	auto s = (sqlite3_stmt*) stmt;
	auto len = sqlite3_column_bytes(s, c);
	auto dat = sqlite3_column_text(s, c);
	if (!dat)
		return std::string();
	return std::string((char const*) dat, std::size_t(len));
}

}
