llvm::json::Value TransformBlob(const types::IBlob& that)
{
    llvm::json::Object result;
    result["payload"]   = runtime::serialize_bytes(that.payload());
    result["modelType"] = "Blob";
    return llvm::json::Value(std::move(result));
}
