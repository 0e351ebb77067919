/**
 * @file coverage_probe.cpp
 * @brief Coverage wrapper source and marker parsing.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/coverage_probe.hpp"

#include <sstream>

namespace code_sandbox {

std::string python_coverage_wrapper() {
    std::ostringstream oss;
    oss << "import dis\n"
        << "import os\n"
        << "import sys\n"
        << "import types\n"
        << "\n"
        << "_TARGET = os.path.join(os.path.dirname(os.path.abspath(__file__)), '"
        << kCoverageTargetFile << "')\n"
        << "\n"
        << "\n"
        << "def _executable_lines(code):\n"
        << "    lines = set()\n"
        << "    pending = [code]\n"
        << "    while pending:\n"
        << "        current = pending.pop()\n"
        << "        lines.update(line for _, line in dis.findlinestarts(current)\n"
        << "                     if line is not None and line > 0)\n"
        << "        pending.extend(c for c in current.co_consts if isinstance(c, types.CodeType))\n"
        << "    return lines\n"
        << "\n"
        << "\n"
        << "with open(_TARGET, encoding='utf-8') as _fh:\n"
        << "    _code = compile(_fh.read(), _TARGET, 'exec')\n"
        << "_executable = _executable_lines(_code)\n"
        << "_seen = set()\n"
        << "\n"
        << "\n"
        << "def _trace(frame, event, arg):\n"
        << "    if frame.f_code.co_filename != _TARGET:\n"
        << "        return None\n"
        << "    if event == 'line':\n"
        << "        _seen.add(frame.f_lineno)\n"
        << "    return _trace\n"
        << "\n"
        << "\n"
        << "sys.settrace(_trace)\n"
        << "try:\n"
        << "    exec(_code, {'__name__': '__main__', '__file__': _TARGET})\n"
        << "finally:\n"
        << "    sys.settrace(None)\n"
        << "    sys.stdout.write('\\n" << kCoverageMarker << " %d %d\\n'\n"
        << "                     % (len(_seen & _executable), len(_executable)))\n"
        << "    sys.stdout.flush()\n";
    return oss.str();
}

std::optional<CoverageCounts> parse_coverage_marker(std::string_view stdout_data) {
    auto position = stdout_data.rfind(kCoverageMarker);
    if (position == std::string_view::npos) return std::nullopt;

    auto rest = stdout_data.substr(position + kCoverageMarker.size());
    auto end = rest.find('\n');
    std::istringstream fields{std::string{rest.substr(0, end)}};

    int64_t covered = -1;
    int64_t total = -1;
    if (!(fields >> covered >> total) || covered < 0 || total < 0 || covered > total) {
        return std::nullopt;
    }
    return CoverageCounts{static_cast<uint32_t>(covered), static_cast<uint32_t>(total)};
}

}  // namespace code_sandbox
