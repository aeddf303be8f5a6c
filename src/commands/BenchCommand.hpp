#pragma once
#include "Command.hpp"

class BenchCommand : public Command {
public:
    BenchCommand(bool reg=false);
    int run() override;

private:
    static BenchCommand instance;
};
