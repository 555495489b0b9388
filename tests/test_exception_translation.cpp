#include <string>

#include "logup/exception.hpp"

using namespace logup;

int main() {
    ExceptionLogEntry entry;
    entry.fatal = true;
    entry.type = "java.lang.RuntimeException";
    entry.message = "lesson failed to load";
    entry.frames = {{"org.example.Lesson", "load", "Lesson.kt", 12}, {"org.example.Main", "main", "", -1}};
    entry.causes = {{"java.io.IOException", "disk read", {{"java.io.File", "read", "File.java", 88}}},
                    {"java.lang.SecurityException", "denied", {}}};

    LoggedException e = toException(entry);
    if (std::string(e.what()) != "lesson failed to load") return 1;
    if (e.type() != "java.lang.RuntimeException") return 2;
    if (!e.fatal()) return 3;
    if (e.frames().size() != 2 || e.frames()[0].lineNumber != 12) return 4;

    const LoggedException* cause = e.cause();
    if (!cause || std::string(cause->what()) != "disk read") return 5;
    if (cause->frames().size() != 1 || cause->frames()[0].declaringClass != "java.io.File") return 6;
    if (!cause->cause() || cause->cause()->type() != "java.lang.SecurityException") return 7;
    if (cause->cause()->cause() != nullptr) return 8;

    std::string text = describe(e);
    if (text != "java.lang.RuntimeException: lesson failed to load\n"
                "Caused by: java.io.IOException: disk read\n"
                "Caused by: java.lang.SecurityException: denied") return 9;

    // Frames must name a class and a method, at any level of the chain
    ExceptionLogEntry broken = entry;
    broken.causes[1].frames.push_back({"org.example.Guard", "", "Guard.kt", 3});
    try {
        (void)toException(broken);
        return 10;
    } catch (const TranslationError& error) {
        if (std::string(error.what()).find("org.example.Guard") == std::string::npos) return 11;
    }

    ExceptionLogEntry bare;
    LoggedException plain = toException(bare);
    if (describe(plain) != "Exception") return 12;
    if (plain.cause() != nullptr) return 13;

    if (describe(std::exception_ptr()) != "no error") return 14;
    return 0;
}
