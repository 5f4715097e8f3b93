/**
 * test_response_cleaner.cpp - Unit tests for cleanResponse
 */

#include "shlama/ResponseCleaner.hpp"

#include <cassert>
#include <iostream>

void test_fenced_block_with_language() {
    auto result = shlama::cleanResponse("```powershell\nGet-ChildItem\n```");
    
    assert(result == "Get-ChildItem");
    
    std::cout << "[PASS] test_fenced_block_with_language\n";
}

void test_fenced_block_without_language() {
    auto result = shlama::cleanResponse("```\nls -la\n```\n");
    
    assert(result == "ls -la");
    
    std::cout << "[PASS] test_fenced_block_without_language\n";
}

void test_single_line_fence_keeps_command() {
    auto result = shlama::cleanResponse("```ls -la```");
    
    assert(result == "ls -la");
    
    std::cout << "[PASS] test_single_line_fence_keeps_command\n";
}

void test_inline_backticks() {
    auto result = shlama::cleanResponse("`dir`");
    
    assert(result == "dir");
    
    std::cout << "[PASS] test_inline_backticks\n";
}

void test_plain_text_is_only_trimmed() {
    auto result = shlama::cleanResponse("  \n find . -name '*.log' \t\n");
    
    assert(result == "find . -name '*.log'");
    
    std::cout << "[PASS] test_plain_text_is_only_trimmed\n";
}

void test_inner_backticks_survive() {
    auto result = shlama::cleanResponse("echo `date` > now.txt");
    
    assert(result == "echo `date` > now.txt");
    
    std::cout << "[PASS] test_inner_backticks_survive\n";
}

void test_crlf_fence() {
    auto result = shlama::cleanResponse("```bash\r\ndf -h\r\n```");
    
    assert(result == "df -h");
    
    std::cout << "[PASS] test_crlf_fence\n";
}

void test_fence_only_is_empty() {
    assert(shlama::cleanResponse("```\n```").empty());
    assert(shlama::cleanResponse("   ").empty());
    
    std::cout << "[PASS] test_fence_only_is_empty\n";
}

void test_only_one_fence_level_removed() {
    // Two blocks: only the outermost markers go, the middle ones stay
    auto result = shlama::cleanResponse("```sh\nls\n```\n```sh\npwd\n```");
    
    assert(result.find("ls") == 0);
    assert(result.find("```") != std::string::npos);
    assert(result.back() == 'd');
    
    std::cout << "[PASS] test_only_one_fence_level_removed\n";
}

int main() {
    std::cout << "Running ResponseCleaner tests...\n\n";
    
    test_fenced_block_with_language();
    test_fenced_block_without_language();
    test_single_line_fence_keeps_command();
    test_inline_backticks();
    test_plain_text_is_only_trimmed();
    test_inner_backticks_survive();
    test_crlf_fence();
    test_fence_only_is_empty();
    test_only_one_fence_level_removed();
    
    std::cout << "\nAll tests passed!\n";
    return 0;
}
