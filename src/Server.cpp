#include <iostream>
#include <string>

#include "matcher.h"
#include "pattern.h"

using namespace std;

// Strip trailing whitespace left on the line, including a '\r' from CRLF input.
static string trim_end(const string& line) {
    size_t end = line.find_last_not_of(" \t\r\n\v\f");
    return end == string::npos ? string() : line.substr(0, end + 1);
}

int main(int argc, char* argv[]) {
    cout << unitbuf;
    cerr << unitbuf;
    cerr << "Logs from your program will appear here" << endl;
    if (argc != 3) {
        cerr << "Expected two arguments" << endl;
        return 1;
    }
    string flag = argv[1];
    string pattern = argv[2];
    if (flag != "-E") {
        cerr << "Expected first argument to be '-E'" << endl;
        return 1;
    }
    string input_line;
    getline(cin, input_line);
    input_line = trim_end(input_line);
    try {
        grep::CompiledPattern compiled = grep::compile(pattern);
        if (grep::is_match(input_line, compiled)) {
            cout << "This is a match" << endl;
            return 0;
        } else {
            cout << "This is not a match" << endl;
            return 1;
        }
    } catch (const grep::PatternError& e) {
        cerr << e.what() << endl;
        return 1;
    }
}
