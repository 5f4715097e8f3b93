/**
 * Console.hpp - Colored terminal output shared by every flow
 */

#pragma once

#include <iosfwd>
#include <string>

namespace shlama {

class Console {
public:
    Console(std::ostream& out, std::ostream& err, bool verbose = false, bool color = false,
            bool err_color = false);
    
    // Console on std::cout/std::cerr; each stream is colored only when it is a
    // terminal and NO_COLOR is unset
    static Console standard(bool verbose);
    
    void suggestion(const std::string& command);
    void info(const std::string& message);
    void success(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void debug(const std::string& message);
    
    // Prints without a trailing newline and flushes, for y/N style questions
    void prompt(const std::string& question);
    
    std::string bold(const std::string& text) const;
    
    std::ostream& out() { return out_; }
    bool verbose() const { return verbose_; }
    
private:
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
    bool color_;
    bool err_color_;
    
    std::string paint(const char* code, const std::string& text) const;
    std::string paintErr(const char* code, const std::string& text) const;
};

} // namespace shlama
