#include <inline-core/macros.hh>

#include <nexus/test.hh>

// exactly one compiler family
#if defined(IC_COMPILER_MSVC) + defined(IC_COMPILER_CLANG) + defined(IC_COMPILER_GCC) + defined(IC_COMPILER_MINGW) != 1
#error "expected exactly one IC_COMPILER_* define"
#endif

#if defined(IC_OS_WINDOWS) + defined(IC_OS_APPLE) + defined(IC_OS_LINUX) + defined(IC_OS_BSD) != 1
#error "expected exactly one IC_OS_* define"
#endif

#if IC_ASSERT_ENABLED != 0 && IC_ASSERT_ENABLED != 1
#error "IC_ASSERT_ENABLED must be 0 or 1"
#endif

namespace
{
IC_FORCE_INLINE int forced(int x) { return x + 1; }

IC_COLD_FUNC int cold(int x) { return x * 2; }
} // namespace

TEST("macros - compilation modes")
{
#if defined(IC_RELEASE) && !defined(IC_ENABLE_ASSERT_IN_RELEASE)
    CHECK(IC_ASSERT_ENABLED == 0);
#else
    CHECK(IC_ASSERT_ENABLED == 1);
#endif

#if defined(IC_COMPILER_MSVC) && defined(IC_COMPILER_POSIX)
    CHECK(false); // MSVC is never a POSIX-style compiler
#endif
}

TEST("macros - function attributes")
{
    CHECK(forced(1) == 2);
    CHECK(cold(3) == 6);
}

TEST("macros - IC_UNUSED does not evaluate")
{
    int counter = 0;
    IC_UNUSED(++counter);
    IC_UNUSED(counter++ + 1);
    CHECK(counter == 0);
}
