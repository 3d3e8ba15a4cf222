#undef PRINT
#undef DEBUG
#undef TRACE
#undef PANIC
#undef ASSERT

#pragma pop_macro("PRINT")
#pragma pop_macro("DEBUG")
#pragma pop_macro("TRACE")
#pragma pop_macro("PANIC")
#pragma pop_macro("ASSERT")
