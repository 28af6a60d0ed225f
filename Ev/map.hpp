#ifndef EV_MAP_HPP
#define EV_MAP_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"Util/make_unique.hpp"
#include<memory>
#include<type_traits>
#include<vector>

namespace Ev {

namespace Detail {

template<typename f, typename a>
using MapResult = typename IoInner<typename std::result_of<f(a)>::type>::type;

/* Collects the results of the greenthreads of one map
 * call.  */
template<typename b>
struct MapState {
	std::vector<std::unique_ptr<b>> results;
	std::exception_ptr exc;
	std::size_t pending;
	bool waiting;
	std::function<void(std::vector<b>)> pass;
	std::function<void(std::exception_ptr)> fail;

	explicit
	MapState(std::size_t n) : results(n)
				, exc(nullptr)
				, pending(n)
				, waiting(false)
				{ }

	void finish() {
		--pending;
		if (pending == 0 && waiting)
			deliver();
	}
	void deliver() {
		/* The callbacks may hold the last reference
		 * to this object.  */
		auto my_pass = std::move(pass);
		auto my_fail = std::move(fail);
		pass = nullptr;
		fail = nullptr;
		if (exc)
			return my_fail(exc);
		auto rv = std::vector<b>();
		rv.reserve(results.size());
		for (auto& r : results)
			rv.push_back(std::move(*r));
		my_pass(std::move(rv));
	}
};

template<typename b, typename f, typename a>
Io<void> map_launch( std::shared_ptr<MapState<b>> st
		   , std::shared_ptr<f> func
		   , std::shared_ptr<std::vector<a>> items
		   , std::size_t i
		   ) {
	if (i == items->size())
		return Ev::lift();
	auto task = Io<void>([st, func, items, i]( std::function<void()> pass
						 , std::function<void(std::exception_ptr)> _
						 ) {
		/* Inside then() so that a throwing function
		 * fails only its own item.  */
		Ev::lift().then([func, items, i]() {
			return (*func)(std::move((*items)[i]));
		}).run([st, i, pass](b val) {
			st->results[i] = Util::make_unique<b>(std::move(val));
			pass();
			st->finish();
		}, [st, pass](std::exception_ptr e) {
			st->exc = e;
			pass();
			st->finish();
		});
	});
	/* Yield between launches so they start in order.  */
	return Ev::concurrent(std::move(task)).then([]() {
		return Ev::yield();
	}).then([st, func, items, i]() {
		return map_launch(st, func, items, i + 1);
	});
}

}

/** Ev::map
 *
 * @brief applies `func` to every item, each in its
 * own greenthread, and collects the results in input
 * order.
 *
 * @desc Completes once every item is done, even if
 * some failed; if any failed, it fails with one of
 * their exceptions.
 * Items are moved into `func`, so move-only items
 * and results work.
 */
template<typename f, typename a>
Io<std::vector<Detail::MapResult<f, a>>>
map(f func, std::vector<a> as) {
	using b = Detail::MapResult<f, a>;
	if (as.empty())
		return Ev::lift(std::vector<b>());

	auto st = std::make_shared<Detail::MapState<b>>(as.size());
	auto pfunc = std::make_shared<f>(std::move(func));
	auto items = std::make_shared<std::vector<a>>(std::move(as));

	return Detail::map_launch<b>(st, pfunc, items, 0).then([st]() {
		return Io<std::vector<b>>([st]( std::function<void(std::vector<b>)> pass
					      , std::function<void(std::exception_ptr)> fail
					      ) {
			st->pass = std::move(pass);
			st->fail = std::move(fail);
			st->waiting = true;
			if (st->pending == 0)
				st->deliver();
		});
	});
}

}

#endif /* !defined(EV_MAP_HPP) */
