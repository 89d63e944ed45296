#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "picoosc/Client.h"
#include "picoosc/Exceptions.h"
#include "picoosc/Server.h"

using namespace picoosc;

namespace {
    // Records received messages and lets the test wait for them. Declare it
    // before the dispatcher so handler threads finish before it is destroyed.
    class Inbox {
       public:
        Handler handler() {
            return [this](const std::string &address, const std::vector<Value> &arguments) {
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.emplace_back(address, arguments);
                condition_.notify_all();
            };
        }

        bool waitFor(size_t count, std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            return condition_.wait_for(lock, timeout, [&] { return messages_.size() >= count; });
        }

        std::vector<Message> messages() {
            std::lock_guard<std::mutex> lock(mutex_);
            return messages_;
        }

       private:
        std::mutex mutex_;
        std::condition_variable condition_;
        std::vector<Message> messages_;
    };

    ServerOptions fastPolling() {
        ServerOptions options;
        options.pollInterval = std::chrono::milliseconds(20);
        return options;
    }

    // Send arbitrary bytes with a plain socket, bypassing the codec
    void sendGarbage(uint16_t port, const std::string &bytes) {
        int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        ASSERT_GE(fd, 0);
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_port = htons(port);
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ssize_t sent = ::sendto(fd, bytes.data(), bytes.size(), 0,
                                reinterpret_cast<const sockaddr *>(&address), sizeof(address));
        ::close(fd);
        ASSERT_EQ(sent, static_cast<ssize_t>(bytes.size()));
    }
}  // namespace

TEST(Server, EndToEnd) {
    Inbox inbox;
    auto dispatcher = std::make_shared<Dispatcher>();
    dispatcher->addHandler("/some/addr", inbox.handler());

    Endpoint endpoint("127.0.0.1", 19994);
    Server server(endpoint, dispatcher);
    server.start();
    ASSERT_TRUE(server.isRunning());
    EXPECT_EQ(server.port(), 19994);

    Client client(endpoint);
    client.send(Message("/some/addr", {"Hey this is something"}));

    ASSERT_TRUE(inbox.waitFor(1, std::chrono::seconds(1)));
    auto messages = inbox.messages();
    EXPECT_EQ(messages[0].getAddress(), "/some/addr");
    ASSERT_EQ(messages[0].getArgumentCount(), 1u);
    EXPECT_EQ(messages[0].getArgument(0).asString(), "Hey this is something");

    server.stop();
}

TEST(Server, Lifecycle) {
    auto dispatcher = std::make_shared<Dispatcher>();
    Server server(Endpoint("127.0.0.1", 0), dispatcher, fastPolling());
    EXPECT_EQ(server.state(), ServerState::Created);
    EXPECT_EQ(server.port(), 0);

    server.start();
    EXPECT_EQ(server.state(), ServerState::Running);
    EXPECT_NE(server.port(), 0);

    // Starting a running server is a no-op
    EXPECT_NO_THROW(server.start());
    EXPECT_TRUE(server.isRunning());

    server.stop();
    EXPECT_EQ(server.state(), ServerState::Stopped);

    // Second stop is a no-op
    EXPECT_NO_THROW(server.stop());
    EXPECT_EQ(server.state(), ServerState::Stopped);

    // A stopped server never resumes
    EXPECT_THROW(server.start(), ServerException);
    EXPECT_FALSE(server.isRunning());
}

TEST(Server, StopBeforeStart) {
    Server server(Endpoint("127.0.0.1", 0), std::make_shared<Dispatcher>());
    server.stop();
    EXPECT_EQ(server.state(), ServerState::Stopped);
    EXPECT_THROW(server.start(), ServerException);
}

TEST(Server, StopReturnsPromptly) {
    Server server(Endpoint("127.0.0.1", 0), std::make_shared<Dispatcher>(), fastPolling());
    server.start();

    auto start = std::chrono::steady_clock::now();
    server.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST(Server, BindErrors) {
    auto dispatcher = std::make_shared<Dispatcher>();

    Server first(Endpoint("127.0.0.1", 0), dispatcher);
    first.start();

    // The same port cannot be bound twice
    Server second(Endpoint("127.0.0.1", first.port()), dispatcher);
    EXPECT_THROW(second.start(), BindError);
    EXPECT_EQ(second.state(), ServerState::Created);

    // Unresolvable host
    Server unresolvable(Endpoint("no-such-host.invalid", 0), dispatcher);
    EXPECT_THROW(unresolvable.start(), BindError);
}

TEST(Server, RejectsDescriptorsBeyondSelectLimit) {
    rlimit limit{};
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &limit), 0);
    if (limit.rlim_max != RLIM_INFINITY && limit.rlim_max <= static_cast<rlim_t>(FD_SETSIZE)) {
        GTEST_SKIP() << "Descriptor limit too low to reach FD_SETSIZE";
    }
    rlimit raised = limit;
    raised.rlim_cur = static_cast<rlim_t>(FD_SETSIZE) + 64;
    if (limit.rlim_max != RLIM_INFINITY && raised.rlim_cur > limit.rlim_max) {
        raised.rlim_cur = limit.rlim_max;
    }
    ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &raised), 0);

    auto dispatcher = std::make_shared<Dispatcher>();
    Server server(Endpoint("127.0.0.1", 0), dispatcher);

    // Occupy every descriptor below FD_SETSIZE so the next socket lands above it
    std::vector<int> filler;
    bool filled = false;
    while (true) {
        int fd = ::open("/dev/null", O_RDONLY);
        if (fd < 0) {
            break;
        }
        filler.push_back(fd);
        if (fd >= FD_SETSIZE - 1) {
            filled = true;
            break;
        }
    }

    if (filled) {
        EXPECT_THROW(server.start(), BindError);
        EXPECT_EQ(server.state(), ServerState::Created);
    }

    for (int fd : filler) {
        ::close(fd);
    }
    setrlimit(RLIMIT_NOFILE, &limit);

    ASSERT_TRUE(filled) << "Could not open descriptors up to FD_SETSIZE";

    // With descriptors available again the same server binds normally
    server.start();
    EXPECT_TRUE(server.isRunning());
    server.stop();
}

TEST(Server, InvalidConstruction) {
    EXPECT_THROW(Server(Endpoint("127.0.0.1", 0), nullptr), InvalidArgumentException);

    ServerOptions options;
    options.receiveBufferSize = 0;
    EXPECT_THROW(Server(Endpoint("127.0.0.1", 0), std::make_shared<Dispatcher>(), options),
                 InvalidArgumentException);
}

TEST(Server, SurvivesMalformedDatagrams) {
    Inbox inbox;
    auto dispatcher = std::make_shared<Dispatcher>();
    dispatcher->addHandler("/ok", inbox.handler());

    Server server(Endpoint("127.0.0.1", 0), dispatcher, fastPolling());
    server.start();

    sendGarbage(server.port(), "garbage!");
    sendGarbage(server.port(), std::string("/ok\0,i\0\0\0", 9));
    sendGarbage(server.port(), std::string("#bundle\0\0\0", 10));
    sendGarbage(server.port(), "");

    Client client(Endpoint("127.0.0.1", server.port()));
    client.send(Message("/ok", {7}));

    ASSERT_TRUE(inbox.waitFor(1, std::chrono::seconds(2)));
    EXPECT_EQ(inbox.messages()[0].getArgument(0).asInt32(), 7);
    EXPECT_TRUE(server.isRunning());
}

TEST(Server, ReceivesBundles) {
    Inbox inbox;
    auto dispatcher = std::make_shared<Dispatcher>();
    dispatcher->addHandler("/bundle/*", inbox.handler());

    Server server(Endpoint("127.0.0.1", 0), dispatcher, fastPolling());
    server.start();

    Bundle bundle;
    bundle.addMessage(Message("/bundle/one", {1})).addMessage(Message("/bundle/two", {2}));
    Client(Endpoint("127.0.0.1", server.port())).send(bundle);

    ASSERT_TRUE(inbox.waitFor(2, std::chrono::seconds(2)));
    EXPECT_EQ(inbox.messages().size(), 2u);
}

TEST(Server, RegistrationWhileRunning) {
    Inbox inbox;
    auto dispatcher = std::make_shared<Dispatcher>();
    Server server(Endpoint("127.0.0.1", 0), dispatcher, fastPolling());
    server.start();

    dispatcher->addHandler("/late", inbox.handler());
    Client(Endpoint("127.0.0.1", server.port())).send("/late", {"registered after start"});

    ASSERT_TRUE(inbox.waitFor(1, std::chrono::seconds(2)));
}
