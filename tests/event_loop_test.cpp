#include <gtest/gtest.h>
#include <chrono>
#include <unistd.h>
#include <sys/epoll.h>
#include "event_loop.hpp"
#include "session_store.hpp"
#include "test_helpers.hpp"

using namespace std::chrono;

namespace
{

std::vector<Readiness> wait_for(EventLoop &loop, milliseconds timeout)
{
    auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline)
    {
        auto ready = loop.wait(10);
        if (!ready.empty())
            return ready;
    }
    return {};
}

}

TEST(EventLoopTest, TimerFiresOnceWithItsSource)
{
    EventLoop loop;
    auto started = steady_clock::now();
    int timer = loop.add_timer(milliseconds(50));

    auto ready = wait_for(loop, milliseconds(1000));
    ASSERT_EQ(ready.size(), 1u);
    EXPECT_EQ(ready[0].fd, timer);
    EXPECT_EQ(ready[0].source, Source::TIMER);
    EXPECT_GE(steady_clock::now() - started, milliseconds(45));
    EXPECT_TRUE(loop.timer_expired(timer));

    loop.cancel_timer(timer);
}

TEST(EventLoopTest, ArmedTimerIsNotExpired)
{
    EventLoop loop;
    int timer = loop.add_timer(milliseconds(10000));
    EXPECT_FALSE(loop.timer_expired(timer));
    loop.cancel_timer(timer);
    EXPECT_FALSE(loop.timer_expired(timer));
}

TEST(EventLoopTest, CancelledTimerNeverFires)
{
    EventLoop loop;
    int timer = loop.add_timer(milliseconds(20));
    loop.cancel_timer(timer);

    EXPECT_TRUE(wait_for(loop, milliseconds(100)).empty());
}

TEST(EventLoopTest, ReadinessCarriesDescriptorAndSource)
{
    EventLoop loop;
    LoopbackSocket sender;
    sockaddr_in target;

    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr;
    setup_sockaddr(addr, "127.0.0.1", 0);
    ASSERT_EQ(bind(fd, (sockaddr *)&addr, sizeof(addr)), 0);
    socklen_t len = sizeof(target);
    getsockname(fd, (sockaddr *)&target, &len);

    loop.add(fd, Source::QUERY, EPOLLIN);
    sender.send_to(target, bytes("ping"));

    auto ready = wait_for(loop, milliseconds(1000));
    ASSERT_EQ(ready.size(), 1u);
    EXPECT_EQ(ready[0].fd, fd);
    EXPECT_EQ(ready[0].source, Source::QUERY);
    EXPECT_TRUE(ready[0].events & EPOLLIN);

    loop.remove(fd);
    close(fd);
}

TEST(SessionStoreTest, WindowDeadlineIsExclusive)
{
    EventLoop loop;
    SessionStore store(loop);
    LoopbackSocket device;

    Envelope query;
    query.address = {10, 0, 0, 5};
    query.port = 54321;
    query.payload = bytes("Q");

    auto before = QuerySession::Clock::now();
    QuerySession *session = store.open(query, 1, device.local(), milliseconds(500));
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(store.size(), 1u);

    EXPECT_FALSE(session->expired(before));
    EXPECT_FALSE(session->expired(session->deadline - milliseconds(1)));
    EXPECT_TRUE(session->expired(session->deadline));
    EXPECT_TRUE(session->expired(session->deadline + milliseconds(1)));

    std::vector<uint8_t> received;
    sockaddr_in from;
    ASSERT_TRUE(device.receive(received, from, 1000));
    EXPECT_EQ(received, bytes("Q"));
}

TEST(SessionStoreTest, RepliesAreAddressedToTheQueryOrigin)
{
    EventLoop loop;
    SessionStore store(loop);
    LoopbackSocket device;

    Envelope query;
    query.address = {10, 0, 0, 5};
    query.port = 54321;
    query.payload = bytes("Q");

    QuerySession *session = store.open(query, 1, device.local(), milliseconds(500));
    auto reply = session->reply(reinterpret_cast<const uint8_t *>("R"), 1);

    EXPECT_EQ(reply.address, query.address);
    EXPECT_EQ(reply.port, query.port);
    EXPECT_EQ(reply.payload, bytes("R"));
}

TEST(SessionStoreTest, TimerClosesOnlyItsOwnWindow)
{
    EventLoop loop;
    SessionStore store(loop);
    LoopbackSocket device;

    Envelope query;
    query.address = {10, 0, 0, 5};
    query.port = 1000;
    query.payload = bytes("Q1");
    QuerySession *first = store.open(query, 1, device.local(), milliseconds(30));
    int first_fd = first->sockfd;
    int first_timer = first->timer_fd;

    query.port = 2000;
    query.payload = bytes("Q2");
    QuerySession *second = store.open(query, 1, device.local(), milliseconds(5000));
    int second_fd = second->sockfd;

    EXPECT_EQ(store.close_expired(-42), -1);
    EXPECT_EQ(store.close_expired(first_timer), 0);
    store.reap();

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find(first_fd), nullptr);
    EXPECT_NE(store.find(second_fd), nullptr);
    EXPECT_EQ(store.close_expired(first_timer), -1);
}
