/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of drillpress.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdlib>
#include <exception>
#include <ostream>
#include <vector>

#include <drillpress/util.h>

#include <drillpress/tool/main_adapter.h>

namespace drillpress::tool {

main_adapter::main_adapter(main_fn_type main_fn)
    : main_fn_{main_fn} {}

int main_adapter::operator()(std::span<std::string const> args,
                             iolayer const& iol) const {
  std::vector<std::string> storage(args.begin(), args.end());
  std::vector<char*> argv;

  argv.reserve(storage.size() + 1);
  for (auto& arg : storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  return main_fn_(static_cast<int>(storage.size()), argv.data(), iol);
}

int main_adapter::safe(int argc, char** argv, iolayer const& iol) const {
  try {
    setup_default_locale();
#ifdef _WIN32
    ::_set_abort_behavior(0, _WRITE_ABORT_MSG);
#endif
    return main_fn_(argc, argv, iol);
  } catch (std::exception const& e) {
    iol.err << "ERROR: " << exception_str(e) << "\n";
  }

  return 1;
}

} // namespace drillpress::tool
