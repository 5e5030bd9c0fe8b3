#pragma once

namespace formcheck::dump_default_params
{
string brief() noexcept;

int run_main(int argc, char** argv);
} // namespace formcheck::dump_default_params
