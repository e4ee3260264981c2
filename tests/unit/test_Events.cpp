#include <gtest/gtest.h>
#include "events/EventSink.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <spdlog/sinks/ostream_sink.h>

using namespace fc::events;

namespace {

std::shared_ptr<spdlog::logger> captureLogger(const std::string& name, std::ostringstream& out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    sink->set_pattern("%l %v");
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::trace);
    return logger;
}

}

TEST(EventTest, DefaultVisibility) {
    EXPECT_FALSE(defaultVisibility(Event::Kind::FILE_COPIED));
    EXPECT_FALSE(defaultVisibility(Event::Kind::FILE_SKIPPED));
    EXPECT_FALSE(defaultVisibility(Event::Kind::FILE_RENAMED));
    EXPECT_FALSE(defaultVisibility(Event::Kind::DIR_CREATED));
    EXPECT_TRUE(defaultVisibility(Event::Kind::DIR_RENAMED));
    EXPECT_TRUE(defaultVisibility(Event::Kind::DIR_DELETED));
    EXPECT_TRUE(defaultVisibility(Event::Kind::WARNING));
    EXPECT_TRUE(defaultVisibility(Event::Kind::ERROR));
}

TEST(EventTest, ToStringCarriesKindAndDetail) {
    const auto e = makeEvent(Event::Kind::FILE_COPIED, "COPY: /m/a.txt", "/s/a.txt", "/m/a.txt");
    EXPECT_EQ(e.toString(), "FILE_COPIED: COPY: /m/a.txt");
    EXPECT_EQ(e.source, "/s/a.txt");
    EXPECT_FALSE(e.visible);
}

TEST(LogSinkTest, RoutesByVisibilityAndSeverity) {
    std::ostringstream component, journal;
    LogSink sink(captureLogger("test_component", component), captureLogger("test_journal", journal));

    sink.emit(makeEvent(Event::Kind::FILE_COPIED, "COPY: x"));
    sink.emit(makeEvent(Event::Kind::ERROR, "ERROR copying y"));
    sink.emit(makeEvent(Event::Kind::WARNING, "odd"));

    EXPECT_NE(journal.str().find("info FILE_COPIED: COPY: x"), std::string::npos);
    EXPECT_EQ(journal.str().find("ERROR"), std::string::npos);
    EXPECT_NE(component.str().find("error ERROR: ERROR copying y"), std::string::npos);
    EXPECT_NE(component.str().find("warning WARNING: odd"), std::string::npos);
    EXPECT_EQ(component.str().find("COPY: x"), std::string::npos);
}

TEST(LogSinkTest, RequiresBothLoggers) {
    std::ostringstream out;
    EXPECT_THROW((void)LogSink(nullptr, captureLogger("only_journal", out)), std::invalid_argument);
}
