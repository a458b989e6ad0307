// ---------------------------------------------------------------------------
// test_response.cpp
//
// 서버 응답 디코더 단위 테스트
//   classify_response / is_result_terminator / OK / ERR / EOF /
//   column definition / COM_STMT_PREPARE OK
// ---------------------------------------------------------------------------

#include "protocol/response.hpp"

#include "scripted_transport.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

// ===========================================================================
// classify_response
// ===========================================================================

// ---------------------------------------------------------------------------
// 1. 첫 바이트별 분류
// ---------------------------------------------------------------------------
TEST(ClassifyResponse, ByHeaderByte) {
    EXPECT_EQ(classify_response(Bytes{0x00, 0x00, 0x00}), ResponseKind::kOk);
    EXPECT_EQ(classify_response(Bytes{0xFF, 0x15, 0x04}), ResponseKind::kError);
    EXPECT_EQ(classify_response(Bytes{0xFB, 'f', 'i', 'l', 'e'}), ResponseKind::kLocalInfile);
    EXPECT_EQ(classify_response(Bytes{0x03}), ResponseKind::kResultSet);
}

// ---------------------------------------------------------------------------
// 2. 0xFE: 9바이트 미만은 EOF, 그 이상은 8바이트 column count
// ---------------------------------------------------------------------------
TEST(ClassifyResponse, FeDependsOnLength) {
    EXPECT_EQ(classify_response(scripted::eof()), ResponseKind::kEof);

    const Bytes huge_count = {0xFE, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(classify_response(huge_count), ResponseKind::kResultSet);
}

// ===========================================================================
// is_result_terminator
// ===========================================================================

// ---------------------------------------------------------------------------
// 3. DEPRECATE_EOF 꺼짐: 0xFE + payload < 9 만 종료
// ---------------------------------------------------------------------------
TEST(ResultTerminator, ClassicEof) {
    EXPECT_TRUE(is_result_terminator(scripted::eof(), false));

    const Bytes row_with_fe(9, 0xFE);
    EXPECT_FALSE(is_result_terminator(row_with_fe, false));
    EXPECT_FALSE(is_result_terminator(Bytes{0x01, 'a'}, false));
}

// ---------------------------------------------------------------------------
// 4. DEPRECATE_EOF 켜짐: 0xFE 로 시작하는 OK 패킷이 종료 표식
// ---------------------------------------------------------------------------
TEST(ResultTerminator, DeprecateEofOk) {
    const auto terminator = scripted::end_of_rows();
    EXPECT_TRUE(is_result_terminator(terminator, true));

    Bytes long_ok(64, 0x00);
    long_ok[0] = 0xFE;
    EXPECT_TRUE(is_result_terminator(long_ok, true));

    EXPECT_FALSE(is_result_terminator(scripted::ok(), true));
    EXPECT_FALSE(is_result_terminator(Bytes{}, true));
}

// ===========================================================================
// OK / ERR / EOF
// ===========================================================================

// ---------------------------------------------------------------------------
// 5. OK: affected / insert id / status / warnings / info
// ---------------------------------------------------------------------------
TEST(OkPacketParse, AllFields) {
    Bytes payload = scripted::ok(3, 300, 0x0003, 2);
    const std::string info = "Rows matched: 3";
    payload.insert(payload.end(), info.begin(), info.end());

    auto ok = parse_ok_packet(payload);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->affected_rows, 3U);
    EXPECT_EQ(ok->last_insert_id, 300U);
    EXPECT_EQ(ok->status_flags, 0x0003);
    EXPECT_EQ(ok->warnings, 2);
    EXPECT_EQ(ok->info, info);
}

// ---------------------------------------------------------------------------
// 6. OK: status / warnings 가 생략된 짧은 패킷
// ---------------------------------------------------------------------------
TEST(OkPacketParse, ShortPacketWithoutStatus) {
    auto ok = parse_ok_packet(Bytes{0x00, 0x01, 0x00});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->affected_rows, 1U);
    EXPECT_EQ(ok->status_flags, 0);
}

// ---------------------------------------------------------------------------
// 7. OK: 잘못된 헤더 / 잘린 lenenc → kFraming
// ---------------------------------------------------------------------------
TEST(OkPacketParse, MalformedIsFraming) {
    auto bad_header = parse_ok_packet(Bytes{0x01, 0x00, 0x00});
    ASSERT_FALSE(bad_header.has_value());
    EXPECT_EQ(bad_header.error().code, ErrorCode::kFraming);

    auto truncated = parse_ok_packet(Bytes{0x00, 0xFC, 0x01});
    ASSERT_FALSE(truncated.has_value());
    EXPECT_EQ(truncated.error().code, ErrorCode::kFraming);
}

// ---------------------------------------------------------------------------
// 8. ERR: code / sql_state / message
// ---------------------------------------------------------------------------
TEST(ErrPacketParse, AllFields) {
    auto err = parse_err_packet(scripted::err(1146, "42S02", "Table 'test.nope' doesn't exist"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->error_code, 1146);
    EXPECT_EQ(err->sql_state, "42S02");
    EXPECT_EQ(err->message, "Table 'test.nope' doesn't exist");
}

// ---------------------------------------------------------------------------
// 9. ERR → Error: code 분류 + 서버 코드 보존
// ---------------------------------------------------------------------------
TEST(ErrPacketParse, ToErrorKeepsServerFields) {
    const auto error = error_from_payload(scripted::err(1045, "28000", "Access denied"),
                                          ErrorCode::kAuthentication);
    EXPECT_EQ(error.code, ErrorCode::kAuthentication);
    EXPECT_EQ(error.server_code, 1045);
    EXPECT_EQ(error.sql_state, "28000");
    EXPECT_EQ(error.message, "Access denied");
}

// ---------------------------------------------------------------------------
// 10. ERR 로 파싱할 수 없는 payload → kFraming
// ---------------------------------------------------------------------------
TEST(ErrPacketParse, NotAnErrPacket) {
    const auto error = error_from_payload(Bytes{0x00, 0x00}, ErrorCode::kServer);
    EXPECT_EQ(error.code, ErrorCode::kFraming);
}

// ---------------------------------------------------------------------------
// 11. EOF: warnings / status
// ---------------------------------------------------------------------------
TEST(EofPacketParse, WarningsAndStatus) {
    auto eof = parse_eof_packet(Bytes{0xFE, 0x01, 0x00, 0x08, 0x00});
    ASSERT_TRUE(eof.has_value());
    EXPECT_EQ(eof->warnings, 1);
    EXPECT_EQ(eof->status_flags, 0x0008);

    EXPECT_FALSE(parse_eof_packet(Bytes(9, 0xFE)).has_value());
}

// ===========================================================================
// Column definition / Prepare OK
// ===========================================================================

// ---------------------------------------------------------------------------
// 12. ColumnDefinition41 전체 필드
// ---------------------------------------------------------------------------
TEST(ColumnDefinitionParse, AllFields) {
    const auto payload = scripted::column_def("id", ColumnType::kLongLong,
                                              column_flag::kUnsigned | column_flag::kNotNull,
                                              kBinaryCharset, 20);

    auto col = parse_column_definition(payload);
    ASSERT_TRUE(col.has_value());
    EXPECT_EQ(col->catalog, "def");
    EXPECT_EQ(col->schema, "test");
    EXPECT_EQ(col->table, "t");
    EXPECT_EQ(col->name, "id");
    EXPECT_EQ(col->org_name, "id");
    EXPECT_EQ(col->charset, kBinaryCharset);
    EXPECT_EQ(col->column_length, 20U);
    EXPECT_EQ(col->type, ColumnType::kLongLong);
    EXPECT_TRUE(col->is_unsigned());
    EXPECT_FALSE(col->is_nullable());
    EXPECT_TRUE(col->is_binary());
    EXPECT_EQ(col->type_name(), "BIGINT UNSIGNED");
}

// ---------------------------------------------------------------------------
// 13. 고정 필드 블록이 잘린 column definition → kFraming
// ---------------------------------------------------------------------------
TEST(ColumnDefinitionParse, TruncatedFixedBlock) {
    auto payload = scripted::column_def("id", ColumnType::kLong);
    payload.resize(payload.size() - 6);

    auto col = parse_column_definition(payload);
    ASSERT_FALSE(col.has_value());
    EXPECT_EQ(col.error().code, ErrorCode::kFraming);
}

// ---------------------------------------------------------------------------
// 14. COM_STMT_PREPARE OK
// ---------------------------------------------------------------------------
TEST(PrepareOkParse, Fields) {
    auto ok = parse_prepare_ok(scripted::prepare_ok(7, 2, 3));
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->statement_id, 7U);
    EXPECT_EQ(ok->num_columns, 2);
    EXPECT_EQ(ok->num_params, 3);

    auto too_short = parse_prepare_ok(Bytes{0x00, 0x01, 0x00});
    ASSERT_FALSE(too_short.has_value());
    EXPECT_EQ(too_short.error().code, ErrorCode::kFraming);
}
