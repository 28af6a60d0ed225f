#include"Chain/Config.hpp"
#include"Chain/LocalAdapter.hpp"
#include"Chain/LocalChain.hpp"
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ev/signal.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Xswap/Demo.hpp"
#include"Xswap/Main.hpp"
#include"Xswap/Mod/CheckpointStore.hpp"
#include"Xswap/Mod/FeedWriter.hpp"
#include"Xswap/Mod/JsonOutputter.hpp"
#include"Xswap/Mod/Logger.hpp"
#include"Xswap/Mod/SwapCoordinator.hpp"
#include"Xswap/Mod/Timers.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Msg/Init.hpp"
#include"Xswap/Shutdown.hpp"
#include"Xswap/concurrent.hpp"
#include"Xswap/log.hpp"
#include<assert.h>
#include<cstdlib>
#include<signal.h>
#include<stdexcept>

#ifndef PACKAGE_STRING
# define PACKAGE_STRING "xswap"
#endif

namespace {

double to_interval(std::string const& opt, std::string const& v) {
	char* end = nullptr;
	auto d = std::strtod(v.c_str(), &end);
	if (v.empty() || *end != '\0' || d <= 0)
		throw std::invalid_argument(opt + ": not a positive number: " + v);
	return d;
}

/* Seconds the demo waits for its swap to settle.  */
auto const demo_timeout = double(120);

}

namespace Xswap {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;

	std::string argv0;
	bool is_version;
	bool is_help;
	bool is_demo;
	std::string bad_option;

	std::vector<Chain::Config> configs;
	std::string db_path;
	LogLevel log_level;
	Mod::Timers::Intervals intervals;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Mod::Waiter> waiter;
	std::unique_ptr<Mod::Logger> logger;
	std::unique_ptr<Mod::JsonOutputter> outputter;
	std::unique_ptr<Mod::FeedWriter> feed;
	std::vector<std::unique_ptr<Chain::LocalChain>> chains;
	std::vector<std::unique_ptr<Chain::LocalAdapter>> adapters;
	std::unique_ptr<Mod::CheckpointStore> checkpoints;
	std::unique_ptr<Mod::SwapCoordinator> coordinator;
	std::unique_ptr<Mod::Timers> timers;

	void parse(std::vector<std::string> const& argv) {
		for (auto i = std::size_t(1); i < argv.size(); ++i) {
			auto const& arg = argv[i];
			auto eq = arg.find('=');
			auto opt = arg.substr(0, eq);
			auto val = eq == std::string::npos ? std::string()
			         : arg.substr(eq + 1)
			         ;
			if (opt == "--version" || opt == "-V")
				is_version = true;
			else if (opt == "--help" || opt == "-H")
				is_help = true;
			else if (opt == "--demo")
				is_demo = true;
			else if (opt == "--chain")
				configs.push_back(Chain::parse_config(val));
			else if (opt == "--db")
				db_path = val;
			else if (opt == "--log-level")
				log_level = log_level_from_string(val);
			else if (opt == "--health-interval")
				intervals.health = to_interval(opt, val);
			else if (opt == "--auction-interval")
				intervals.auction = to_interval(opt, val);
			else if (opt == "--recovery-interval")
				intervals.recovery = to_interval(opt, val);
			else
				throw std::invalid_argument("Unrecognized option: " + arg);
		}
		if (is_demo && configs.empty()) {
			configs.push_back(Chain::parse_config("etherlink"));
			configs.push_back(Chain::parse_config("monad"));
		}
		if (is_demo && configs.size() != 2)
			throw std::invalid_argument("--demo needs exactly two chains");
		for (auto const& c : configs)
			if (c.endpoint != "local")
				throw std::invalid_argument( c.name
							   + ": unsupported endpoint "
							   + c.endpoint
							   );
	}

	void usage() {
		cout << "Usage: " << argv0 << " [options]" << std::endl
		     << std::endl
		     << "Options:" << std::endl
		     << " --chain=NAME[:key=value,...]  Monitor a chain; repeatable." << std::endl
		     << "                               Keys: id, confirmations, block-time," << std::endl
		     << "                               endpoint, account." << std::endl
		     << " --db=PATH                     Checkpoint database (default xswap.sqlite3)." << std::endl
		     << " --log-level=LEVEL             trace, debug, info, warn or error." << std::endl
		     << " --health-interval=S           Seconds between health checks." << std::endl
		     << " --auction-interval=S          Seconds between auction updates." << std::endl
		     << " --recovery-interval=S         Seconds between recovery scans." << std::endl
		     << " --demo                        Run one swap between two local chains." << std::endl
		     << " --version, -V                 Show version." << std::endl
		     << " --help, -H                    Show this help." << std::endl
		     ;
	}

	void build() {
		bus = Util::make_unique<S::Bus>();
		waiter = Util::make_unique<Mod::Waiter>(*bus);
		logger = Util::make_unique<Mod::Logger>(*bus, cerr, log_level);
		outputter = Util::make_unique<Mod::JsonOutputter>(cout, *bus);
		feed = Util::make_unique<Mod::FeedWriter>(*bus);

		auto clock = []() { return std::uint64_t(Ev::now()); };
		auto raw = std::vector<Chain::LedgerAdapter*>();
		for (auto const& c : configs) {
			chains.emplace_back(Util::make_unique<Chain::LocalChain>(
				c.chain_id, c.account, clock
			));
			adapters.emplace_back(Util::make_unique<Chain::LocalAdapter>(
				*bus, *waiter, *chains.back(), c
			));
			raw.push_back(adapters.back().get());
		}

		/* The demo leaves nothing behind.  */
		auto db = Sqlite3::Db(is_demo ? std::string(":memory:") : db_path);
		checkpoints = Util::make_unique<Mod::CheckpointStore>(std::move(db));
		coordinator = Util::make_unique<Mod::SwapCoordinator>(
			*bus, *waiter, *checkpoints, std::move(raw)
		);
		timers = Util::make_unique<Mod::Timers>(*bus, *waiter, intervals);
	}

	/* Local chains produce a block every block_time.  */
	Ev::Io<void> produce_blocks(std::size_t i) {
		auto period = configs[i].block_time;
		return waiter->wait(period).then([this, i]() {
			chains[i]->mine(1);
			return produce_blocks(i);
		});
	}

	Ev::Io<int> serve() {
		return Xswap::log( *bus, Info
				 , "Main: watching %zu chains; interrupt to stop"
				 , configs.size()
				 ).then([]() {
			return Ev::signal({SIGINT, SIGTERM});
		}).then([this](int signum) {
			return Xswap::log( *bus, Info
					 , "Main: got signal %d, stopping"
					 , signum
					 ).then([]() {
				return Ev::lift(0);
			});
		});
	}

	Ev::Io<int> demo() {
		return Xswap::demo( *bus, *waiter, *coordinator
				  , *chains[0], *adapters[0]
				  , *chains[1], *adapters[1]
				  , demo_timeout
				  );
	}

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    ) : cout(cout_)
	      , cerr(cerr_)
	      , is_version(false)
	      , is_help(false)
	      , is_demo(false)
	      , db_path("xswap.sqlite3")
	      , log_level(Info)
	      {
		assert(argv.size() >= 1);
		argv0 = argv[0];
		try {
			parse(argv);
		} catch (std::invalid_argument const& e) {
			bad_option = e.what();
		}
	}

	Ev::Io<int> run() {
		if (!bad_option.empty()) {
			cerr << argv0 << ": " << bad_option << std::endl;
			usage();
			return Ev::lift(2);
		} else if (is_version) {
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		} else if (is_help) {
			usage();
			return Ev::lift(0);
		} else if (configs.empty()) {
			cerr << argv0 << ": no --chain given" << std::endl;
			return Ev::lift(2);
		}

		build();

		return Ev::yield().then([this]() {
			auto act = Ev::lift();
			for (auto i = std::size_t(0); i < configs.size(); ++i) {
				if (configs[i].block_time <= 0)
					continue;
				act += Xswap::concurrent(produce_blocks(i));
			}
			return act;
		}).then([this]() {
			return coordinator->start();
		}).then([this]() {
			return bus->raise(Msg::Init());
		}).then([this]() {
			if (is_demo)
				return demo();
			return serve();
		}).then([this](int code) {
			return coordinator->stop().then([this]() {
				return bus->raise(Xswap::Shutdown());
			}).then([code]() {
				return Ev::lift(code);
			});
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  ) : pimpl(Util::make_unique<Impl>(std::move(argv), cout, cerr))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	assert(pimpl);
	return pimpl->run();
}

}
