#pragma once
#include "Command.hpp"

#define TEST_CMD_NAME "test"

class TestCommand : public Command {
public:
    TestCommand(bool reg=false);
    int run() override;

private:
    static TestCommand instance;
};
