#ifndef UTIL_MAKE_UNIQUE_HPP
#define UTIL_MAKE_UNIQUE_HPP

#include<memory>
#include<utility>

namespace Util {

/* std::make_unique is C++14.  */
template<typename T, typename... As>
std::unique_ptr<T> make_unique(As&&... as) {
	return std::unique_ptr<T>(new T(std::forward<As>(as)...));
}

}

#endif /* !defined(UTIL_MAKE_UNIQUE_HPP) */
