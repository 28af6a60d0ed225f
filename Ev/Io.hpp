#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

/* Pre-declare for Detail::IoInner.  */
template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};
/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};

/* Wraps a pass function so that only the first of pass
 * or fail is honored.  */
template<typename a>
struct Once {
	static
	typename PassFunc<a>::type
	wrap(std::shared_ptr<bool> done, typename PassFunc<a>::type pass) {
		return [done, pass](a value) {
			if (*done)
				return;
			*done = true;
			pass(std::move(value));
		};
	}
};
template<>
struct Once<void> {
	static
	PassFunc<void>::type
	wrap(std::shared_ptr<bool> done, PassFunc<void>::type pass) {
		return [done, pass]() {
			if (*done)
				return;
			*done = true;
			pass();
		};
	}
};

/* Base for Io<a>.  */
template<typename a>
class IoBase {
public:
	typedef typename Detail::PassFunc<a>::type PassF;
	typedef std::function<void (std::exception_ptr)> FailF;
	typedef std::function<void (PassF, FailF)> CoreFunc;

protected:
	CoreFunc core;

	template <typename b>
	friend class Ev::Io;
	template <typename b>
	friend class IoBase;

public:
	IoBase(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::catching
	 *
	 * @brief if the action throws an exception of
	 * type `e`, continue with the action returned
	 * by the handler instead.
	 * Other exceptions propagate unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ](PassF pass, FailF fail) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr err) {
				auto next = std::shared_ptr<Io<a>>();
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						next = std::make_shared<Io<a>>(
							handler(ex)
						);
					} catch (...) {
						fail(std::current_exception());
						return;
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			core_copy(pass, sub_fail);
		});
	}

	/** Ev::Io<a>::run
	 *
	 * @brief executes the action, calling exactly one
	 * of pass or fail, at most once.
	 */
	void run(PassF pass, FailF fail) const noexcept {
		auto done = std::make_shared<bool>(false);
		auto sub_pass = Once<a>::wrap(done, std::move(pass));
		auto sub_fail = [done, fail](std::exception_ptr e) {
			if (*done)
				return;
			*done = true;
			fail(std::move(e));
		};
		try {
			core(std::move(sub_pass), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

}

template<typename a>
class Io : public Detail::IoBase<a> {
public:
	Io(typename Detail::IoBase<a>::CoreFunc core_)
		: Detail::IoBase<a>(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b*/
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f(a)>::type>::type>
	then(f func) const {
		using b = typename Detail::IoInner<typename std::result_of<f(a)>::type>::type;
		auto core_copy = this->core;
		/* Continuation Monad.  */
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , std::function<void (std::exception_ptr)> fail
			      ) {
			auto sub_pass = [func, pass, fail](a value) {
				try {
					func(std::move(value)).core(pass, fail);
				} catch (...) {
					fail(std::current_exception());
				}
			};
			try {
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}
};

/* Separate then-implementation for Io<void>.  */
template<>
class Io<void> : public Detail::IoBase<void> {
public:
	Io(Detail::IoBase<void>::CoreFunc core_)
		: Detail::IoBase<void>(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b*/
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f()>::type>::type>
	then(f func) const {
		using b = typename Detail::IoInner<typename std::result_of<f()>::type>::type;
		auto core_copy = core;
		/* Continuation Monad.  */
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , std::function<void (std::exception_ptr)> fail
			      ) {
			auto sub_pass = [func, pass, fail]() {
				try {
					func().core(pass, fail);
				} catch (...) {
					fail(std::current_exception());
				}
			};
			try {
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	/* (>>) :: IO () -> IO () -> IO () */
	Io<void>& operator+=(Io<void> o) {
		auto po = std::make_shared<Io<void>>(std::move(o));
		*this = then([po]() { return *po; });
		return *this;
	}
};

inline
Io<void> operator+(Io<void> a, Io<void> b) {
	a += std::move(b);
	return a;
}

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift(void) {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)> fail
			  ) {
		pass();
	});
}

}

#endif /* !defined(EV_IO_HPP) */
