#pragma once
#include "Command.hpp"

class GetCommand : public IndexCommand {
public:
    int run() override;

private:
    static GetCommand instance; // Static instance to trigger registration
    GetCommand(bool reg=false);

    friend class CmdTestBase<GetCommand>;
};
