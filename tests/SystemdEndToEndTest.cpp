#include "service_control/Platform.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>

namespace svcctl::test {

    //---Полный цикл на systemd-хосте: автоопределение, установка, запуск, статус, удаление
    TEST(SystemdEndToEndTest, FullLifecycleOnDetectedSystemdHost)
    {
        TempRoot root;
        root.mkdir("run/systemd/system");
        root.write("bin/sampled", "#!/bin/sh\nexit 0\n",
            fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);

        auto manager = std::make_shared<FakeServiceManager>();

        BackendConfig config;
        config.rootDir = root.path();
        config.searchPath = (root.path() / "bin").string();
        config.runner = manager;

        ServiceDescriptor descriptor;
        descriptor.name = "sampled";
        descriptor.description = "Sample Daemon";
        descriptor.arguments = { "--flag" };
        descriptor.dependencies = { "network" };

        auto backend = makeBackend(descriptor, config);
        ASSERT_TRUE(backend);
        ASSERT_EQ(backend->kind(), BackendKind::Systemd);

        //---Установка
        const ActionResult installed = backend->install();
        ASSERT_TRUE(installed.ok()) << installed.error.detail;
        EXPECT_EQ(installed.message, "Install Sample Daemon:\t\t\t\t\t[  OK  ]");

        const fs::path unit = root.path() / "etc/systemd/system/sampled.service";
        EXPECT_EQ(backend->descriptorPath().string(), unit.string());

        const std::string text = readFile(unit);
        const std::string exe = (root.path() / "bin/sampled").lexically_normal().string();
        EXPECT_NE(text.find("Description=Sample Daemon\n"), std::string::npos) << text;
        EXPECT_NE(text.find("Requires=network\n"), std::string::npos);
        EXPECT_NE(text.find("After=network\n"), std::string::npos);
        EXPECT_NE(text.find("ExecStart=" + exe + " --flag\n"), std::string::npos) << text;
        EXPECT_NE(text.find("PIDFile=/var/run/sampled.pid\n"), std::string::npos);
        EXPECT_NE(text.find("WantedBy=multi-user.target\n"), std::string::npos);

        //---Запуск
        const ActionResult started = backend->start();
        ASSERT_TRUE(started.ok()) << started.error.detail;
        EXPECT_TRUE(manager->called("systemctl start sampled.service"));

        //---Статус
        const ActionResult status = backend->status();
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(status.runtime.has_value());
        EXPECT_TRUE(status.runtime->running);
        ASSERT_TRUE(status.runtime->pid.has_value());
        EXPECT_EQ(*status.runtime->pid, 4321);

        //---Остановка и удаление
        ASSERT_TRUE(backend->stop().ok());
        EXPECT_TRUE(manager->called("systemctl stop sampled.service"));

        const ActionResult removed = backend->remove();
        ASSERT_TRUE(removed.ok());
        EXPECT_TRUE(removed.warnings.empty());
        EXPECT_FALSE(fs::exists(unit));

        //---Порядок нативных команд при установке и удалении
        const std::vector<std::string> registration = {
            "systemctl daemon-reload",
            "systemctl enable sampled.service",
        };
        auto it = std::search(manager->calls.begin(), manager->calls.end(),
            registration.begin(), registration.end());
        EXPECT_NE(it, manager->calls.end());
    }

    TEST(SystemdEndToEndTest, ExecutableWithSpacesIsQuoted)
    {
        TempRoot root;
        auto manager = std::make_shared<FakeServiceManager>();

        BackendConfig config;
        config.rootDir = root.path();
        config.runner = manager;

        //---exe с пробелом в пути
        root.write("my bin/tool", "#!/bin/sh\n", fs::perms::owner_all);
        config.searchPath = (root.path() / "my bin").string();

        ServiceDescriptor descriptor;
        descriptor.name = "tool";
        descriptor.description = "Sample\nDaemon";

        auto backend = makeBackend(BackendKind::Systemd, descriptor, config);
        std::string text;
        ASSERT_TRUE(backend->renderDescriptor({ "-v" }, text, nullptr));

        const std::string exe = (root.path() / "my bin/tool").lexically_normal().string();
        EXPECT_NE(text.find("ExecStart=\"" + exe + "\" -v\n"), std::string::npos) << text;
        EXPECT_NE(text.find("Description=SampleDaemon\n"), std::string::npos) << text;
    }

} // namespace svcctl::test
