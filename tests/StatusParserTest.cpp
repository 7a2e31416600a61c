#include "service_control/StatusParser.hpp"

#include <gtest/gtest.h>

namespace svcctl::test {

    TEST(StatusParserTest, SystemdActive)
    {
        const RuntimeStatus st = systemdStatusParser().parse(
            "● sampled.service - Sample Daemon\n"
            "     Loaded: loaded (/etc/systemd/system/sampled.service; enabled)\n"
            "     Active: active (running) since Mon 2026-10-19 10:00:00 UTC; 5s ago\n"
            "   Main PID: 812 (sampled)\n");
        EXPECT_TRUE(st.running);
        ASSERT_TRUE(st.pid.has_value());
        EXPECT_EQ(*st.pid, 812);
    }

    TEST(StatusParserTest, SystemdInactive)
    {
        const RuntimeStatus st = systemdStatusParser().parse(
            "○ sampled.service - Sample Daemon\n"
            "     Active: inactive (dead)\n");
        EXPECT_FALSE(st.running);
        EXPECT_FALSE(st.pid.has_value());
    }

    TEST(StatusParserTest, UpstartRunningAndWaiting)
    {
        const StatusParser p = upstartStatusParser("sampled");
        const RuntimeStatus running = p.parse("sampled start/running, process 2301\n");
        EXPECT_TRUE(running.running);
        ASSERT_TRUE(running.pid.has_value());
        EXPECT_EQ(*running.pid, 2301);

        EXPECT_FALSE(p.parse("sampled stop/waiting\n").running);
    }

    TEST(StatusParserTest, SysVRunning)
    {
        const RuntimeStatus st = sysvStatusParser("sampled").parse("sampled (pid  3344) is running...\n");
        EXPECT_TRUE(st.running);
        ASSERT_TRUE(st.pid.has_value());
        EXPECT_EQ(*st.pid, 3344);
    }

    TEST(StatusParserTest, LaunchdList)
    {
        const RuntimeStatus st = launchdStatusParser("com.example.sampled").parse(
            "{\n"
            "\t\"Label\" = \"com.example.sampled\";\n"
            "\t\"LastExitStatus\" = 0;\n"
            "\t\"PID\" = 501;\n"
            "};\n");
        EXPECT_TRUE(st.running);
        ASSERT_TRUE(st.pid.has_value());
        EXPECT_EQ(*st.pid, 501);
    }

    TEST(StatusParserTest, RcdRunning)
    {
        const RuntimeStatus st = rcdStatusParser("sampled").parse("sampled is running as pid 7788.\n");
        EXPECT_TRUE(st.running);
        ASSERT_TRUE(st.pid.has_value());
        EXPECT_EQ(*st.pid, 7788);
    }

    //---Вывод о другой службе: остановлена, pid не извлекается
    TEST(StatusParserTest, OtherServiceOutputMeansStopped)
    {
        const RuntimeStatus sysv = sysvStatusParser("sampled").parse("other (pid  12) is running...\n");
        EXPECT_FALSE(sysv.running);
        EXPECT_FALSE(sysv.pid.has_value());

        const RuntimeStatus launchd = launchdStatusParser("sampled").parse(
            "{\n\t\"Label\" = \"other\";\n\t\"PID\" = 99;\n};\n");
        EXPECT_FALSE(launchd.running);
        EXPECT_FALSE(launchd.pid.has_value());

        const RuntimeStatus rcd = rcdStatusParser("sampled").parse("other is running as pid 7788.\n");
        EXPECT_FALSE(rcd.running);
        EXPECT_FALSE(rcd.pid.has_value());

        const RuntimeStatus upstart = upstartStatusParser("sampled").parse("other start/running, process 5\n");
        EXPECT_FALSE(upstart.running);
        EXPECT_FALSE(upstart.pid.has_value());
    }

    TEST(StatusParserTest, EmptyOutputMeansStopped)
    {
        for (const StatusParser& p : { sysvStatusParser("sampled"), launchdStatusParser("sampled"),
                 rcdStatusParser("sampled"), systemdStatusParser() })
        {
            const RuntimeStatus st = p.parse("");
            EXPECT_FALSE(st.running) << p.presencePattern();
            EXPECT_FALSE(st.pid.has_value());
        }
    }

    TEST(StatusParserTest, PresenceWithoutPid)
    {
        const RuntimeStatus st = launchdStatusParser("sampled").parse("{\n\t\"Label\" = \"sampled\";\n};\n");
        EXPECT_TRUE(st.running);
        EXPECT_FALSE(st.pid.has_value());
    }

    TEST(StatusParserTest, NameIsMatchedLiterally)
    {
        //---Точка в имени не должна совпадать с любым символом
        const StatusParser p = sysvStatusParser("my.svc");
        EXPECT_FALSE(p.parse("myXsvc (pid  10) is running...\n").running);
        EXPECT_TRUE(p.parse("my.svc (pid  10) is running...\n").running);
        EXPECT_EQ(p.presencePattern(), "my\\.svc");
    }

    TEST(StatusParserTest, EscapeRegex)
    {
        EXPECT_EQ(escapeRegex("plain-name_1"), "plain-name_1");
        EXPECT_EQ(escapeRegex("a.b+c"), "a\\.b\\+c");
        EXPECT_EQ(escapeRegex("(x)[y]{z}"), "\\(x\\)\\[y\\]\\{z\\}");
    }

    TEST(StatusParserTest, DescribeRuntime)
    {
        RuntimeStatus st;
        EXPECT_EQ(st.describe(), "Service is stopped");
        st.running = true;
        EXPECT_EQ(st.describe(), "Service is running...");
        st.pid = 42;
        EXPECT_EQ(st.describe(), "Service (pid  42) is running...");
    }

} // namespace svcctl::test
