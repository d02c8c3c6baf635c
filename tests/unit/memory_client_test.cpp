#include "s3session/memory_client.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using s3session::Bytes;
using s3session::InMemoryStorageClient;
using s3session::StorageErrorCode;
using s3session::ToBytes;

void TestCreateBucketTwiceReportsAlreadyExists() {
    InMemoryStorageClient client;
    assert(client.CreateBucket("b").ok());
    assert(client.CreateBucket("b").code == StorageErrorCode::kAlreadyExists);
    assert(client.HasBucket("b"));
}

void TestObjectOperationsRequireBucket() {
    InMemoryStorageClient client;
    std::vector<std::string> keys;
    Bytes data;

    assert(client.PutObject("missing", "k", ToBytes("x")).code == StorageErrorCode::kNoSuchBucket);
    assert(client.ListObjects("missing", &keys).code == StorageErrorCode::kNoSuchBucket);
    assert(client.GetObject("missing", "k", &data).code == StorageErrorCode::kNoSuchBucket);
    assert(client.DeleteObject("missing", "k").code == StorageErrorCode::kNoSuchBucket);
    assert(client.DeleteBucket("missing").code == StorageErrorCode::kNoSuchBucket);
}

void TestListIsSortedAndGetReturnsBytes() {
    InMemoryStorageClient client;
    assert(client.CreateBucket("b").ok());
    assert(client.PutObject("b", "2_b.txt", ToBytes("second")).ok());
    assert(client.PutObject("b", "1_a.txt", ToBytes("first")).ok());

    std::vector<std::string> keys{"stale"};
    assert(client.ListObjects("b", &keys).ok());
    assert((keys == std::vector<std::string>{"1_a.txt", "2_b.txt"}));

    Bytes data;
    assert(client.GetObject("b", "2_b.txt", &data).ok());
    assert(data == ToBytes("second"));
    assert(client.GetObject("b", "3_c.txt", &data).code == StorageErrorCode::kNoSuchKey);
}

void TestDeleteBucketRequiresEmptyBucket() {
    InMemoryStorageClient client;
    assert(client.CreateBucket("b").ok());
    assert(client.PutObject("b", "k", ToBytes("x")).ok());

    assert(client.DeleteBucket("b").code == StorageErrorCode::kBucketNotEmpty);
    assert(client.DeleteObject("b", "k").ok());
    assert(client.DeleteObject("b", "k").code == StorageErrorCode::kNoSuchKey);
    assert(client.ObjectCount("b") == 0);
    assert(client.DeleteBucket("b").ok());
    assert(!client.HasBucket("b"));
}

} // namespace

int main() {
    TestCreateBucketTwiceReportsAlreadyExists();
    TestObjectOperationsRequireBucket();
    TestListIsSortedAndGetReturnsBytes();
    TestDeleteBucketRequiresEmptyBucket();

    std::cout << "memory_client_test passed" << std::endl;
    return 0;
}
