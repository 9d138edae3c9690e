/*

test_async_mutex.cpp
--------------------

Ensure the connection lock serializes coroutines in arrival order.

*/

#define BOOST_TEST_MODULE async_mutex_test

#include <boost/test/unit_test.hpp>
#include <chrono>
#include <string>
#include <vector>
#include <mailwire/detail/async_mutex.hpp>

using namespace mailwire;


BOOST_AUTO_TEST_CASE(waiters_run_in_fifo_order)
{
    asio::io_context ctx;
    detail::async_mutex mutex(ctx.get_executor());
    std::vector<std::string> trace;

    auto worker = [&](std::string name) -> asio::awaitable<void>
    {
        auto guard = co_await mutex.lock();
        BOOST_REQUIRE(guard);
        trace.push_back(name + " in");
        asio::steady_timer pause(ctx, std::chrono::milliseconds(5));
        co_await pause.async_wait(asio::use_awaitable);
        trace.push_back(name + " out");
    };

    for (const char* name : {"a", "b", "c"})
        asio::co_spawn(ctx, worker(name), asio::detached);
    ctx.run();

    const std::vector<std::string> expected{"a in", "a out", "b in", "b out", "c in", "c out"};
    BOOST_TEST(trace == expected, boost::test_tools::per_element());
    BOOST_TEST(!mutex.is_locked());
}

BOOST_AUTO_TEST_CASE(lock_released_with_guard)
{
    asio::io_context ctx;
    detail::async_mutex mutex(ctx.get_executor());
    bool second_acquired = false;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            {
                auto first = co_await mutex.lock();
                BOOST_REQUIRE(first);
                BOOST_TEST(first->owns_lock());
                BOOST_TEST(mutex.is_locked());
            }
            BOOST_TEST(!mutex.is_locked());
            auto second = co_await mutex.lock();
            second_acquired = second.has_value();
        },
        asio::detached);
    ctx.run();

    BOOST_TEST(second_acquired);
    BOOST_TEST(!mutex.is_locked());
}
