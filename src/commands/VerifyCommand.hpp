#pragma once
#include "Command.hpp"

class VerifyCommand : public IndexCommand {
public:
    int run() override;

private:
    static VerifyCommand instance; // Static instance to trigger registration
    VerifyCommand(bool reg=false);

    friend class CmdTestBase<VerifyCommand>;
};
