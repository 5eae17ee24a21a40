#ifndef CLI_HPP
#define CLI_HPP

#include <ostream>
#include <string>
#include <vector>

namespace svgstego {

    extern const char* const USAGE_TIP;

    // args[0] 是 mode（embed / extract / capacity / distortion / help），
    // 不含程序名。结果写到 out，诊断写到 std::cerr。返回进程 exit status。
    int runCli(const std::vector<std::string>& args, std::ostream& out);

}

#endif
