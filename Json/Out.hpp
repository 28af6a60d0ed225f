#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Json/Detail/escape.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>
#include<type_traits>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::ostringstream Content;
template<typename Up> class Array;
template<typename Up> class Object;

/** struct Json::Detail::Serializer<t>
 *
 * @brief renders a single value of type `t` as JSON
 * text.  Values of unsupported types fail to compile.
 */
template<typename t, typename = void>
struct Serializer;

/* All integer types print in decimal, widened so that
 * char-sized ones are not printed as characters.  */
template<typename t>
struct Serializer< t
		 , typename std::enable_if< std::is_integral<t>::value
					 && !std::is_same<t, bool>::value
					 >::type
		 > {
	typedef typename std::conditional< std::is_signed<t>::value
					 , std::int64_t
					 , std::uint64_t
					 >::type Wide;
	static std::string serialize(t v) {
		return std::to_string(Wide(v));
	}
};
template<>
struct Serializer<double> {
	static std::string serialize(double v) { return from_double(v); }
};
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) { return v ? "true" : "false"; }
};
template<>
struct Serializer<std::nullptr_t> {
	static std::string serialize(std::nullptr_t) { return "null"; }
};

inline
std::string quote(std::string const& s) {
	return "\"" + escape(s) + "\"";
}
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) { return quote(v); }
};
template<std::size_t n>
struct Serializer<char [n]> {
	static std::string serialize(char const v[n]) { return quote(v); }
};

/* An absent value is null.  */
template<typename a>
struct Serializer<std::unique_ptr<a>> {
	static std::string serialize(std::unique_ptr<a> const& p) {
		return p ? Serializer<a>::serialize(*p) : std::string("null");
	}
};

/** class Json::Detail::Scope<Up>
 *
 * @brief an open `{` or `[` inside the document,
 * returning to the enclosing `Up` when it closes.
 */
template<typename Up>
class Scope {
private:
	bool first;

protected:
	Up& up;
	Content& content;

	Scope(Up& up_, Content& content_, char open)
		: first(true), up(up_), content(content_) {
		content << open;
	}

	/* Separates this element from the one before.  */
	void next() {
		if (!first)
			content << ", ";
		first = false;
	}
	void key(std::string const& name) {
		next();
		content << quote(name) << ": ";
	}
	Up& close(char c) {
		content << c;
		return up;
	}
};

template<typename Up>
class Object : public Scope<Up> {
public:
	Object(Up& up, Content& content) : Scope<Up>(up, content, '{') { }

	template<typename a>
	Object<Up>& field(std::string const& name, a const& value) {
		this->key(name);
		this->content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Object<Up>> start_array(std::string const& name) {
		this->key(name);
		return Array<Object<Up>>(*this, this->content);
	}
	Object<Object<Up>> start_object(std::string const& name) {
		this->key(name);
		return Object<Object<Up>>(*this, this->content);
	}

	Up& end_object() { return this->close('}'); }
};

template<typename Up>
class Array : public Scope<Up> {
public:
	Array(Up& up, Content& content) : Scope<Up>(up, content, '[') { }

	template<typename a>
	Array<Up>& entry(a const& value) {
		this->next();
		this->content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Array<Up>> start_array() {
		this->next();
		return Array<Array<Up>>(*this, this->content);
	}
	Object<Array<Up>> start_object() {
		this->next();
		return Object<Array<Up>>(*this, this->content);
	}

	Up& end_array() { return this->close(']'); }
};

}

/** class Json::Out
 *
 * @brief builds JSON text in a single pass.
 *
 * @desc Start with `start_object()` or `start_array()`
 * and chain calls; each `end_*` returns the enclosing
 * builder.  Copies write into the same buffer.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }

	std::string output() const { return content->str(); }

	Json::Detail::Object<Json::Out> start_object() {
		return Json::Detail::Object<Json::Out>(*this, *content);
	}
	Json::Detail::Array<Json::Out> start_array() {
		return Json::Detail::Array<Json::Out>(*this, *content);
	}

	static
	Json::Out empty_object() {
		return Json::Out().start_object().end_object();
	}
};

/* A finished document nests as a value.  */
namespace Detail {
template<>
struct Serializer<Json::Out> {
	static std::string serialize(Json::Out const& v) { return v.output(); }
};
}

}

#endif /* !defined(JSON_OUT_HPP) */
