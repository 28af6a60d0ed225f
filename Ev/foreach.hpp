#ifndef EV_FOREACH_HPP
#define EV_FOREACH_HPP

#include"Ev/map.hpp"

namespace Ev {

namespace Detail {

/* Turns an action without result into one that map
 * can collect.  */
template<typename f>
struct Discard {
	f func;

	template<typename a>
	Io<bool> operator()(a value) const {
		return func(std::move(value)).then([]() {
			return Ev::lift(true);
		});
	}
};

}

/** Ev::foreach
 *
 * @brief like `Ev::map`, for functions returning
 * `Ev::Io<void>`.
 */
template<typename f, typename a>
Io<void> foreach(f func, std::vector<a> as) {
	return Ev::map( Detail::Discard<f>{std::move(func)}
		      , std::move(as)
		      ).then([](std::vector<bool>) {
		return Ev::lift();
	});
}

}

#endif /* !defined(EV_FOREACH_HPP) */
