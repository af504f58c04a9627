#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <unordered_set>

#include "completiontoken.hpp"

using namespace ::lanshare::utils;
using namespace ::testing;

TEST(CompletionTokenTest, CopiesShareState)
{
    CompletionToken token;
    CompletionToken copy {token};

    EXPECT_TRUE(token == copy);
    EXPECT_FALSE(token == CompletionToken {});

    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_FALSE(token.is_completed());

    copy.complete();
    EXPECT_TRUE(token.is_completed());

    std::unordered_set<CompletionToken> tokens {token, copy};
    EXPECT_EQ(tokens.size(), 1u);
}

TEST(CompletionTokenTest, WaitForCompletion)
{
    CompletionToken token;
    EXPECT_FALSE(token.wait_for_completion(std::chrono::milliseconds {10}));

    std::thread completer {[token] {
        std::this_thread::sleep_for(std::chrono::milliseconds {20});
        token.complete();
        token.complete();
    }};
    token.wait_for_completion();
    EXPECT_TRUE(token.wait_for_completion(std::chrono::milliseconds {0}));
    completer.join();
}
