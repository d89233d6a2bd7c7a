#include "nixops/util/error.hh"
#include "nixops/util/logging.hh"
#include "nixops/util/terminal.hh"

#include <gtest/gtest.h>

namespace nixops {

/* ----------------------------------------------------------------------------
 * HintFmt
 * --------------------------------------------------------------------------*/

TEST(HintFmt, arg)
{
    ASSERT_EQ(HintFmt("Hello %s!", "world").str(), "Hello " ANSI_WARNING "world" ANSI_NORMAL "!");
}

TEST(HintFmt, uncolored)
{
    ASSERT_EQ(HintFmt("Hello %s!", Uncolored("world")).str(), "Hello world!");
}

TEST(HintFmt, tooFewArguments)
{
    ASSERT_EQ(HintFmt("only one arg %1% %2%", "fulfilled").str(), "only one arg " ANSI_WARNING "fulfilled" ANSI_NORMAL " ");
}

TEST(HintFmt, tooManyArguments)
{
    ASSERT_EQ(
        HintFmt("what about this %1% %2%", "%3%", "one", "two").str(),
        "what about this " ANSI_WARNING "%3%" ANSI_NORMAL " " ANSI_WARNING "one" ANSI_NORMAL);
}

TEST(fmt, plain)
{
    ASSERT_EQ(fmt("%s-%s-%s", "nixops", "1234", "net"), "nixops-1234-net");
}

/* ----------------------------------------------------------------------------
 * BaseError
 * --------------------------------------------------------------------------*/

MakeError(TestError, Error);

TEST(BaseError, message)
{
    TestError e("the option '%s' is used but not defined", "location");
    ASSERT_EQ(filterANSIEscapes(e.message(), true), "the option 'location' is used but not defined");
    ASSERT_EQ(filterANSIEscapes(e.what(), true), "error: the option 'location' is used but not defined");
}

TEST(BaseError, addTraceResetsWhat)
{
    TestError e("the option '%s' is used but not defined", "subnets.default.addressPrefix");
    std::string before = e.what();

    e.addTrace("while resolving the option '%s'", "subnets");
    ASSERT_TRUE(e.hasTrace());

    auto after = filterANSIEscapes(e.what(), true);
    ASSERT_NE(filterANSIEscapes(before, true), after);
    ASSERT_NE(after.find("… while resolving the option 'subnets'"), std::string::npos);
    ASSERT_NE(after.find("error: the option 'subnets.default.addressPrefix' is used but not defined"), std::string::npos);
}

TEST(BaseError, tracesAreTruncated)
{
    loggerSettings.showTrace = false;

    TestError e("innermost");
    for (auto name : {"a", "b", "c", "d"})
        e.addTrace("while resolving the option '%s'", name);

    auto what = filterANSIEscapes(e.what(), true);
    ASSERT_NE(what.find("option 'd'"), std::string::npos);
    ASSERT_EQ(what.find("option 'a'"), std::string::npos);
    ASSERT_NE(what.find("stack trace truncated"), std::string::npos);
}

TEST(BaseError, showTraceShowsAllTraces)
{
    loggerSettings.showTrace = true;

    TestError e("innermost");
    for (auto name : {"a", "b", "c", "d"})
        e.addTrace("while resolving the option '%s'", name);

    auto what = filterANSIEscapes(e.what(), true);
    ASSERT_NE(what.find("option 'a'"), std::string::npos);
    ASSERT_EQ(what.find("stack trace truncated"), std::string::npos);

    loggerSettings.showTrace = false;
}

TEST(BaseError, suggestions)
{
    TestError e(Suggestions::bestMatches({"location", "tags"}, "locaton"), "the option '%s' does not exist", "locaton");
    auto what = filterANSIEscapes(e.what(), true);
    ASSERT_NE(what.find("Did you mean location?"), std::string::npos);
}

TEST(BaseError, exitStatus)
{
    TestError e(3, "failed");
    ASSERT_EQ(e.info().status, 3u);
    e.withExitStatus(4);
    ASSERT_EQ(e.info().status, 4u);
}

/* ----------------------------------------------------------------------------
 * logEI
 * --------------------------------------------------------------------------*/

TEST(logEI, capturesBasicProperties)
{
    try {
        throw TestError("an error for testing purposes");
    } catch (Error & e) {
        testing::internal::CaptureStderr();
        logger->logEI(e.info());
        auto str = testing::internal::GetCapturedStderr();

        ASSERT_EQ(filterANSIEscapes(str, true), "error: an error for testing purposes\n");
    }
}

TEST(logEI, warningsAreFiltered)
{
    auto old = verbosity;
    verbosity = lvlError;

    testing::internal::CaptureStderr();
    warn("unknown setting '%s'", "foo");
    auto str = testing::internal::GetCapturedStderr();
    ASSERT_EQ(str, "");

    verbosity = lvlWarn;

    testing::internal::CaptureStderr();
    warn("unknown setting '%s'", "foo");
    str = testing::internal::GetCapturedStderr();
    ASSERT_EQ(filterANSIEscapes(str, true), "warning: unknown setting 'foo'\n");

    verbosity = old;
}

TEST(printMsg, respectsVerbosity)
{
    auto old = verbosity;
    verbosity = lvlInfo;

    testing::internal::CaptureStderr();
    debug("resolving the option '%s'", "location");
    printInfo("resolved %d options", 7);
    auto str = testing::internal::GetCapturedStderr();
    ASSERT_EQ(filterANSIEscapes(str, true), "resolved 7 options\n");

    verbosity = old;
}

} // namespace nixops
