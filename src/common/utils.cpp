#include "polyrun/common/utils.hpp"
#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <stdlib.h>
#include <sys/types.h>
#include <algorithm>
#include <cctype>

namespace polyrun {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

int get_userid(const string &name) {
    if (is_number(name)) return stoi(name);

    errno = 0;
    struct passwd *pwd = getpwnam(name.c_str());
    if (!pwd || errno) return -1;
    return (int)pwd->pw_uid;
}

int get_groupid(const string &name) {
    if (is_number(name)) return stoi(name);

    errno = 0;
    struct group *g = getgrnam(name.c_str());
    if (!g || errno) return -1;
    return (int)g->gr_gid;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace polyrun
