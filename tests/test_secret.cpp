#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "secret.hpp"

using namespace std;

namespace {

// "1234567890" 반복 (64 바이트 / 32 바이트)
const string SECRET1 =
    "31323334353637383930313233343536373839303132333435363738393031323334353637383930313233343536373839303132"
    "333435363738393031323334";
const string SECRET2 = "3132333435363738393031323334353637383930313233343536373839303132";

string as_text(const Secret& secret)
{
    const vector<unsigned char>& bytes = secret.to_bytes();
    return string(bytes.begin(), bytes.end());
}

}  // namespace

TEST(SecretTest, hex_decodes_to_ascii_digits)
{
    Secret s1 = Secret::from_hex(SECRET1);
    ASSERT_EQ(s1.size(), 64u);

    vector<int> expected;
    for (int i = 0; i < 64; ++i)
    {
        expected.push_back('0' + (i + 1) % 10);
    }
    EXPECT_EQ(s1.to_int_list(), expected);
    EXPECT_EQ(s1.to_hex(), SECRET1);
}

TEST(SecretTest, conversions_preserve_bytes)
{
    Secret s1 = Secret::from_hex(SECRET1);
    vector<int> ints = s1.to_int_list();

    Secret s2 = Secret::from_int_list(vector<long long>(ints.begin(), ints.end()));
    EXPECT_EQ(s1, s2);

    Secret s3 = Secret::from_base32(s1.to_base32());
    EXPECT_EQ(s1, s3);

    Secret s4 = Secret::from_hex(SECRET2);
    EXPECT_NE(s1, s4);
    EXPECT_EQ(s4.to_hex(), SECRET2);
}

TEST(SecretTest, base32_known_value)
{
    Secret secret = Secret::from_base32("GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ");
    EXPECT_EQ(as_text(secret), "12345678901234567890");
    EXPECT_EQ(secret.to_base32(), "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ");

    Secret hello = Secret::from_base32("JBSWY3DPEHPK3PXP");
    EXPECT_EQ(hello.to_hex(), "48656c6c6f21deadbeef");
}

TEST(SecretTest, base32_is_normalized)
{
    Secret expected = Secret::from_base32("JBSWY3DPEHPK3PXP");
    EXPECT_EQ(Secret::from_base32("jbswy3dpehpk3pxp"), expected);
    EXPECT_EQ(Secret::from_base32(" jbsw y3dp\tehpk 3pxp\n"), expected);
}

TEST(SecretTest, base32_padding_is_optional)
{
    EXPECT_EQ(as_text(Secret::from_base32("MY")), "f");
    EXPECT_EQ(as_text(Secret::from_base32("MZXQ")), "fo");
    EXPECT_EQ(as_text(Secret::from_base32("MZXW6")), "foo");
    EXPECT_EQ(as_text(Secret::from_base32("MZXW6YQ=")), "foob");
    EXPECT_EQ(as_text(Secret::from_base32("MZXW6YTB")), "fooba");
    EXPECT_EQ(as_text(Secret::from_base32("MZXW6YTBOI======")), "foobar");
}

TEST(SecretTest, base32_output_is_padded)
{
    EXPECT_EQ(Secret::from_hex("66").to_base32(), "MY======");
    EXPECT_EQ(Secret::from_hex("666f6f").to_base32(), "MZXW6===");
    EXPECT_EQ(Secret().to_base32(), "");
}

TEST(SecretTest, base32_rejects_invalid_input)
{
    EXPECT_THROW(Secret::from_base32("MZ1W6YTB"), FormatError);   // '1'은 알파벳이 아님
    EXPECT_THROW(Secret::from_base32("MZXW6!"), FormatError);
    EXPECT_THROW(Secret::from_base32("MZ=W6YTB"), FormatError);   // 중간의 '='
    EXPECT_THROW(Secret::from_base32("M======="), FormatError);   // 패딩 7개
    EXPECT_THROW(Secret::from_base32("MZX====="), FormatError);   // 패딩 5개
    EXPECT_THROW(Secret::from_base32("MZXW6Y=="), FormatError);   // 패딩 2개
}

TEST(SecretTest, hex_rejects_invalid_input)
{
    EXPECT_THROW(Secret::from_hex("123"), FormatError);
    EXPECT_THROW(Secret::from_hex("zz"), FormatError);
    EXPECT_THROW(Secret::from_hex("31g2"), FormatError);
}

TEST(SecretTest, hex_accepts_separating_whitespace)
{
    EXPECT_EQ(Secret::from_hex("31 32 33"), Secret::from_hex("313233"));
}

TEST(SecretTest, int_list_wraps_modulo_256)
{
    Secret secret = Secret::from_int_list({-1, 256, 257, -128, 127});
    EXPECT_EQ(secret.to_int_list(), (vector<int>{255, 0, 1, 128, 127}));
}

TEST(SecretTest, empty_secrets_are_equal)
{
    EXPECT_TRUE(Secret().empty());
    EXPECT_EQ(Secret(), Secret::from_int_list({}));
    EXPECT_NE(Secret(), Secret::from_int_list({0}));
}

TEST(SecretTest, assignment_replaces_bytes)
{
    Secret secret = Secret::from_hex(SECRET2);
    Secret other = Secret::from_base32("JBSWY3DPEHPK3PXP");

    secret = other;
    EXPECT_EQ(secret, other);
    EXPECT_EQ(as_text(secret), "Hello!\xde\xad\xbe\xef");

    const Secret& same = secret;
    secret = same;
    EXPECT_EQ(secret, other);

    Secret moved = Secret::from_hex(SECRET1);
    moved = std::move(other);
    EXPECT_EQ(moved, secret);
    EXPECT_TRUE(other.empty());
}
