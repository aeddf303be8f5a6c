#pragma once
#include "Command.hpp"

class ReplayCommand : public Command {
public:
    ReplayCommand(bool reg=false);
    int run() override;

private:
    static ReplayCommand instance;
};
