#include "service_control/Cli.hpp"
#include "service_control/Installer.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace svcctl::test {

    namespace {

        //---argv из списка строк (argv[0] = имя программы)
        CliOptions parse(std::vector<std::string> args)
        {
            args.insert(args.begin(), "service-control");
            std::vector<char*> argv;
            for (auto& a : args) argv.push_back(a.data());
            argv.push_back(nullptr);
            return parseCli((int)args.size(), argv.data());
        }

    } // namespace

    TEST(CliTest, NoCommandMeansHelp)
    {
        EXPECT_EQ(parse({}).cmd, Command::Help);
        EXPECT_EQ(parse({ "--name=x" }).cmd, Command::Help);
    }

    TEST(CliTest, TwoCommandsAreInvalid)
    {
        EXPECT_EQ(parse({ "--install", "--remove", "--name=x" }).cmd, Command::Invalid);
    }

    TEST(CliTest, EachCommandFlag)
    {
        EXPECT_EQ(parse({ "--install" }).cmd, Command::Install);
        EXPECT_EQ(parse({ "--remove" }).cmd, Command::Remove);
        EXPECT_EQ(parse({ "--start" }).cmd, Command::Start);
        EXPECT_EQ(parse({ "--stop" }).cmd, Command::Stop);
        EXPECT_EQ(parse({ "--status" }).cmd, Command::Status);
        EXPECT_EQ(parse({ "--print" }).cmd, Command::Print);
    }

    TEST(CliTest, OptionsAreParsed)
    {
        const CliOptions o = parse({
            "--install",
            "--name=sampled",
            "--desc=\"Sample Daemon\"",
            "--args=--flag -v",
            "--deps=network, dbus",
            "--backend=sysv",
            "--template=/tmp/unit.tmpl",
            "--root=/srv/root",
            "--log-dir=/var/log/sc",
        });

        EXPECT_EQ(o.cmd, Command::Install);
        EXPECT_EQ(o.name, "sampled");
        EXPECT_EQ(o.description, "Sample Daemon");
        EXPECT_EQ(o.args, (std::vector<std::string>{ "--flag", "-v" }));
        EXPECT_EQ(o.deps, (std::vector<std::string>{ "network", "dbus" }));
        EXPECT_EQ(o.backend, "sysv");
        EXPECT_EQ(o.templateFile, "/tmp/unit.tmpl");
        EXPECT_EQ(o.rootDir, "/srv/root");
        EXPECT_EQ(o.logDir, "/var/log/sc");
    }

    TEST(CliTest, SplitList)
    {
        EXPECT_TRUE(splitList("", true).empty());
        EXPECT_TRUE(splitList("  \t ", false).empty());
        EXPECT_EQ(splitList("a  b\tc", false), (std::vector<std::string>{ "a", "b", "c" }));
        EXPECT_EQ(splitList("a,b", false), (std::vector<std::string>{ "a,b" }));
        EXPECT_EQ(splitList("a,b ,c", true), (std::vector<std::string>{ "a", "b", "c" }));
    }

    TEST(CliTest, HelpListsCommands)
    {
        std::ostringstream os;
        printHelp(os);
        const std::string text = os.str();
        for (const char* flag : { "--install", "--remove", "--start", "--stop", "--status", "--print", "--backend=" })
            EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }

    TEST(InstallerTest, MissingNameIsUsageError)
    {
        CliOptions o;
        o.cmd = Command::Status;
        std::ostringstream os;
        EXPECT_EQ(runInstaller(o, os), 2);
    }

    TEST(InstallerTest, UnknownBackendIsUsageError)
    {
        CliOptions o;
        o.cmd = Command::Print;
        o.name = "sampled";
        o.backend = "windows";
        std::ostringstream os;
        EXPECT_EQ(runInstaller(o, os), 2);
        EXPECT_TRUE(os.str().empty());
    }

    TEST(InstallerTest, UnreadableTemplateIsUsageError)
    {
        TempRoot root;
        CliOptions o;
        o.cmd = Command::Print;
        o.name = "sampled";
        o.backend = "systemd";
        o.templateFile = (root.path() / "missing.tmpl").string();
        std::ostringstream os;
        EXPECT_EQ(runInstaller(o, os), 2);
    }

    TEST(InstallerTest, PrintRendersWithoutTouchingRoot)
    {
        TempRoot root;
        CliOptions o;
        o.cmd = Command::Print;
        o.name = "sampled";
        o.description = "   ";
        o.args = { "--flag" };
        o.backend = "upstart";
        o.rootDir = root.path().string();

        std::ostringstream os;
        ASSERT_EQ(runInstaller(o, os), 0);

        const std::string text = os.str();
        EXPECT_EQ(text.rfind("# " + (root.path() / "etc/init/sampled.conf").string() + "\n", 0), 0u) << text;

        //---Пустое описание заменяется именем
        EXPECT_NE(text.find("description     \"sampled\""), std::string::npos) << text;
        EXPECT_NE(text.find(" --flag >> /var/log/sampled.log"), std::string::npos);
        EXPECT_FALSE(fs::exists(root.path() / "etc/init/sampled.conf"));
    }

    TEST(InstallerTest, PrintUsesTemplateFile)
    {
        TempRoot root;
        const fs::path tmpl = root.write("unit.tmpl", "label={{Name}} desc={{Description}}\n");

        CliOptions o;
        o.cmd = Command::Print;
        o.name = "sampled";
        o.description = "Sample Daemon";
        o.backend = "launchd";
        o.rootDir = root.path().string();
        o.templateFile = tmpl.string();

        std::ostringstream os;
        ASSERT_EQ(runInstaller(o, os), 0);
        EXPECT_NE(os.str().find("\nlabel=sampled desc=Sample Daemon\n"), std::string::npos) << os.str();
    }

    TEST(InstallerTest, PrintReportsTemplateErrors)
    {
        TempRoot root;
        const fs::path tmpl = root.write("unit.tmpl", "{{Unknown}}\n");

        CliOptions o;
        o.cmd = Command::Print;
        o.name = "sampled";
        o.backend = "rcd";
        o.rootDir = root.path().string();
        o.templateFile = tmpl.string();

        std::ostringstream os;
        EXPECT_EQ(runInstaller(o, os), 1);
    }

} // namespace svcctl::test
