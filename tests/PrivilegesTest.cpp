#include "service_control/Privileges.hpp"

#include <gtest/gtest.h>

namespace svcctl::test {

    namespace {

        //---Отвечает на `id -g` заранее заданным результатом
        class IdRunner final : public process::ICommandRunner {
        public:
            bool starts = true;
            int exitCode = 0;
            std::string output;
            std::string lastCommand;

            bool run(const std::string& program, const std::vector<std::string>& args,
                process::RunResult& out) override
            {
                lastCommand = process::formatCommand(program, args);
                out = {};
                if (!starts) return false;
                out.started = true;
                out.exitCode = exitCode;
                out.output = output;
                return true;
            }
        };

    } // namespace

    TEST(PrivilegesTest, RootGroupPasses)
    {
        IdRunner r;
        r.output = "0\n";
        EXPECT_TRUE(checkPrivileges(r).ok());
        EXPECT_EQ(r.lastCommand, "id -g");
    }

    TEST(PrivilegesTest, OtherGroupIsInsufficient)
    {
        IdRunner r;
        r.output = "1000\n";
        EXPECT_EQ(checkPrivileges(r).code, ErrorCode::InsufficientPrivileges);
    }

    TEST(PrivilegesTest, MissingIdIsUnsupported)
    {
        IdRunner r;
        r.starts = false;
        EXPECT_EQ(checkPrivileges(r).code, ErrorCode::UnsupportedSystem);
    }

    TEST(PrivilegesTest, FailingIdIsUnsupported)
    {
        IdRunner r;
        r.exitCode = 1;
        r.output = "0\n";
        EXPECT_EQ(checkPrivileges(r).code, ErrorCode::UnsupportedSystem);
    }

    TEST(PrivilegesTest, GarbageOutputIsUnsupported)
    {
        IdRunner r;
        r.output = "id: cannot find name for group ID\n";
        EXPECT_EQ(checkPrivileges(r).code, ErrorCode::UnsupportedSystem);

        r.output = "";
        EXPECT_EQ(checkPrivileges(r).code, ErrorCode::UnsupportedSystem);
    }

    TEST(PrivilegesTest, ParseGroupId)
    {
        unsigned long gid = 77;
        EXPECT_TRUE(parseGroupId("  0 \n", gid));
        EXPECT_EQ(gid, 0u);
        EXPECT_TRUE(parseGroupId("20", gid));
        EXPECT_EQ(gid, 20u);

        EXPECT_FALSE(parseGroupId("-1", gid));
        EXPECT_FALSE(parseGroupId("1 2", gid));
        EXPECT_FALSE(parseGroupId("99999999999999999999", gid));
    }

} // namespace svcctl::test
