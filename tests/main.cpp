#include <iostream>

void run_lexer_tests();
void run_parser_tests();
void run_semantic_tests();
void run_frame_tests();
void run_codegen_x64_tests();
void run_codegen_aarch64_tests();
void run_target_tests();
void run_diagnostics_tests();
void run_examples_smoke();

int main(){
    run_lexer_tests();
    run_parser_tests();
    run_semantic_tests();
    run_frame_tests();
    run_target_tests();
    run_codegen_x64_tests();
    run_codegen_aarch64_tests();
    run_diagnostics_tests();
    run_examples_smoke();
    std::cout << "All tests passed" << std::endl;
    return 0;
}
